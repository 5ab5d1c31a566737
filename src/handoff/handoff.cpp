#include "argenv/handoff.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unordered_map>

#include <unistd.h>

#include <spdlog/spdlog.h>

extern char** environ;

namespace argenv {

namespace {

constexpr const char* DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

std::string search_path() {
    const char* path = std::getenv("PATH");
    return path ? std::string(path) : std::string(DEFAULT_PATH);
}

// Owns the argv/envp strings and exposes them as execve-compatible arrays
struct ExecArrays {
    std::vector<std::string> argv_strings;
    std::vector<std::string> env_strings;
    std::vector<char*> argv;
    std::vector<char*> envp;

    void finalize() {
        for (auto& s : argv_strings) {
            argv.push_back(const_cast<char*>(s.c_str()));
        }
        argv.push_back(nullptr);
        for (auto& s : env_strings) {
            envp.push_back(const_cast<char*>(s.c_str()));
        }
        envp.push_back(nullptr);
    }
};

} // namespace

std::vector<std::string> current_environment() {
    std::vector<std::string> env;
    if (environ) {
        for (char** e = environ; *e != nullptr; ++e) {
            env.emplace_back(*e);
        }
    }
    return env;
}

std::vector<std::string> build_environment(const LaunchPlan& plan,
                                           const std::vector<std::string>& inherited) {
    std::vector<std::string> env;
    std::unordered_map<std::string, size_t> index;

    auto set = [&](const std::string& name, const std::string& value) {
        auto it = index.find(name);
        if (it != index.end()) {
            env[it->second] = name + "=" + value;
        } else {
            index.emplace(name, env.size());
            env.push_back(name + "=" + value);
        }
    };

    for (const auto& entry : inherited) {
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        set(entry.substr(0, eq), entry.substr(eq + 1));
    }
    for (const auto& [name, value] : plan.extra_environment) {
        set(name, value);
    }
    for (const auto& [name, value] : plan.bindings.entries()) {
        set(name, value);
    }
    return env;
}

std::optional<std::string> resolve_executable(const std::string& executable,
                                              const std::string& path_env) {
    if (executable.empty()) {
        return std::nullopt;
    }
    if (executable.find('/') != std::string::npos) {
        return executable;
    }

    size_t start = 0;
    while (start <= path_env.size()) {
        size_t end = path_env.find(':', start);
        if (end == std::string::npos) end = path_env.size();

        // An empty PATH entry means the current directory
        std::string dir = path_env.substr(start, end - start);
        std::string candidate = dir.empty() ? executable : dir + "/" + executable;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::string current_executable_path(const std::string& argv0) {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.string();
    }
    auto absolute = std::filesystem::absolute(argv0, ec);
    return ec ? argv0 : absolute.lexically_normal().string();
}

std::string exec_replace(const LaunchPlan& plan) {
    auto binary = resolve_executable(plan.executable, search_path());
    if (!binary) {
        return "executable not found: " + plan.executable;
    }

    ExecArrays arrays;
    arrays.argv_strings.push_back(plan.executable);
    arrays.env_strings = build_environment(plan, current_environment());
    arrays.finalize();

    spdlog::debug("exec {} with {} binding(s)", *binary, plan.bindings.size());
    execve(binary->c_str(), arrays.argv.data(), arrays.envp.data());

    // If we get here, execve failed
    return "execve failed: " + std::string(strerror(errno));
}

} // namespace argenv
