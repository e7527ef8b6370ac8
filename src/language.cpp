#include "codepair/language.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace codepair {

namespace {

LanguageSpec interpreted(Language language, const std::string& name,
                         const std::string& source_file, const std::string& toolchain,
                         std::vector<std::string> run_argv) {
    LanguageSpec spec;
    spec.language = language;
    spec.name = name;
    spec.source_file = source_file;
    spec.toolchain = toolchain;
    spec.run_argv = std::move(run_argv);
    spec.timeout_ms = DEFAULT_TIMEOUT_MS;
    return spec;
}

LanguageSpec compiled(Language language, const std::string& name,
                      const std::string& source_file, const std::string& toolchain,
                      std::vector<std::string> build_argv,
                      std::vector<std::string> run_argv) {
    LanguageSpec spec;
    spec.language = language;
    spec.name = name;
    spec.source_file = source_file;
    spec.toolchain = toolchain;
    spec.build_argv = std::move(build_argv);
    spec.run_argv = std::move(run_argv);
    spec.timeout_ms = COMPILED_TIMEOUT_MS;
    spec.memory_limit_bytes = 512 * 1024 * 1024;
    spec.cpu_seconds = 20;
    spec.scratch_bytes = 256 * 1024 * 1024;
    return spec;
}

} // namespace

LanguageTable LanguageTable::defaults() {
    LanguageTable table;

    auto js = interpreted(Language::JAVASCRIPT, "javascript", "main.js", "node",
                          {"node", "{src}"});
    js.memory_limit_bytes = 512 * 1024 * 1024;
    js.remote_language = "javascript";
    js.remote_version = "18.15.0";
    table.set(js);

    // tsx is fetched by npx on first use: the one network exception
    auto ts = interpreted(Language::TYPESCRIPT, "typescript", "main.ts", "npx",
                          {"npx", "--yes", "tsx", "{src}"});
    ts.timeout_ms = 10000;
    ts.memory_limit_bytes = 512 * 1024 * 1024;
    ts.allow_network = true;
    ts.remote_language = "typescript";
    ts.remote_version = "5.0.3";
    table.set(ts);

    auto py = interpreted(Language::PYTHON, "python", "main.py", "python3",
                          {"python3", "-u", "{src}"});
    py.remote_language = "python";
    py.remote_version = "3.10.0";
    table.set(py);

    // Single-file source launch; the public class must be Main
    auto java = compiled(Language::JAVA, "java", "Main.java", "java",
                         {}, {"java", "-Xmx256m", "-XX:+UseSerialGC", "{src}"});
    java.memory_limit_bytes = 1024ULL * 1024 * 1024;
    java.remote_language = "java";
    java.remote_version = "15.0.2";
    table.set(java);

    auto go = compiled(Language::GO, "go", "main.go", "go",
                       {"go", "build", "-o", "{bin}", "{src}"}, {"{bin}"});
    go.remote_language = "go";
    go.remote_version = "1.16.2";
    table.set(go);

    auto rust = compiled(Language::RUST, "rust", "main.rs", "rustc",
                         {"rustc", "-O", "-o", "{bin}", "{src}"}, {"{bin}"});
    rust.remote_language = "rust";
    rust.remote_version = "1.68.2";
    table.set(rust);

    auto cpp = compiled(Language::CPP, "cpp", "main.cpp", "g++",
                        {"g++", "-O2", "-std=c++17", "-o", "{bin}", "{src}"}, {"{bin}"});
    cpp.remote_language = "c++";
    cpp.remote_version = "10.2.0";
    table.set(cpp);

    return table;
}

const LanguageSpec* LanguageTable::find(Language language) const {
    auto it = specs_.find(language);
    return it != specs_.end() ? &it->second : nullptr;
}

const LanguageSpec& LanguageTable::at(Language language) const {
    auto spec = find(language);
    if (!spec) {
        throw std::out_of_range("Language not configured: " + language_name(language));
    }
    return *spec;
}

void LanguageTable::set(const LanguageSpec& spec) {
    specs_[spec.language] = spec;
}

std::vector<Language> LanguageTable::languages() const {
    std::vector<Language> result;
    for (const auto& [language, _] : specs_) {
        result.push_back(language);
    }
    return result;
}

std::optional<Language> parse_language(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    static const std::map<std::string, Language> names = {
        {"javascript", Language::JAVASCRIPT},
        {"typescript", Language::TYPESCRIPT},
        {"python", Language::PYTHON},
        {"java", Language::JAVA},
        {"go", Language::GO},
        {"rust", Language::RUST},
        {"cpp", Language::CPP}
    };

    auto it = names.find(lower);
    if (it == names.end()) return std::nullopt;
    return it->second;
}

std::string language_name(Language language) {
    switch (language) {
        case Language::JAVASCRIPT: return "javascript";
        case Language::TYPESCRIPT: return "typescript";
        case Language::PYTHON: return "python";
        case Language::JAVA: return "java";
        case Language::GO: return "go";
        case Language::RUST: return "rust";
        case Language::CPP: return "cpp";
    }
    return "unknown";
}

std::string route_name(Route route) {
    return route == Route::LOCAL ? "local" : "gateway";
}

std::optional<Route> parse_route(const std::string& name) {
    if (name == "local") return Route::LOCAL;
    if (name == "gateway") return Route::GATEWAY;
    return std::nullopt;
}

} // namespace codepair
