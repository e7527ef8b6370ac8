#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include "codepair/constants.h"

namespace codepair {

enum class Language {
    JAVASCRIPT,
    TYPESCRIPT,
    PYTHON,
    JAVA,
    GO,
    RUST,
    CPP
};

// Where a language is executed. Fixed per deployment, never checked per request.
enum class Route {
    LOCAL,
    GATEWAY
};

// Everything the core needs to know about one language.
// Argument templates may contain {src}, {bin} and {workdir}; each argument is
// substituted on its own and passed to execvp, never through a shell.
struct LanguageSpec {
    Language language;
    std::string name;                       // "python"
    std::string source_file;                // "main.py"
    std::string toolchain;                  // binary that must be on PATH
    std::vector<std::string> build_argv;    // empty for interpreted languages
    std::vector<std::string> run_argv;

    int timeout_ms = DEFAULT_TIMEOUT_MS;    // covers build + run
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    int cpu_seconds = DEFAULT_CPU_SECONDS;
    int nice = DEFAULT_NICE;
    size_t scratch_bytes = DEFAULT_SCRATCH_BYTES;
    int max_processes = MAX_PROCESSES_PER_SANDBOX;
    bool allow_network = false;             // toolchain fetches an artifact on first use

    Route route = Route::LOCAL;
    std::string remote_language;            // empty: no remote mapping
    std::string remote_version;
};

// Declarative per-language configuration consulted by every component.
class LanguageTable {
public:
    // Built-in table for all supported languages
    static LanguageTable defaults();

    const LanguageSpec* find(Language language) const;
    const LanguageSpec& at(Language language) const;

    // Replace or add an entry
    void set(const LanguageSpec& spec);

    std::vector<Language> languages() const;

private:
    std::map<Language, LanguageSpec> specs_;
};

// Case-insensitive; returns nullopt for anything outside the supported set
std::optional<Language> parse_language(const std::string& name);

std::string language_name(Language language);

std::string route_name(Route route);
std::optional<Route> parse_route(const std::string& name);

} // namespace codepair
