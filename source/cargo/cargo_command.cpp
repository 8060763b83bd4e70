#include "cargo/cargo_command.hpp"

namespace cargo_command {

using namespace cargo_requests;

namespace {

void append_package(std::vector<std::string> &arguments, const std::optional<std::string> &package) {
    if (package) {
        arguments.push_back("--package");
        arguments.push_back(*package);
    }
}

void append_flag(std::vector<std::string> &arguments, bool enabled, const char *flag) {
    if (enabled) {
        arguments.push_back(flag);
    }
}

void append_option(std::vector<std::string> &arguments, const char *flag,
                   const std::optional<std::string> &value) {
    if (value) {
        arguments.push_back(flag);
        arguments.push_back(*value);
    }
}

std::string join(const std::vector<std::string> &items, const std::string &separator) {
    std::string joined;
    for (size_t index = 0; index < items.size(); ++index) {
        if (index > 0) {
            joined += separator;
        }
        joined += items[index];
    }
    return joined;
}

struct ArgumentBuilder {
    std::vector<std::string> operator()(const CargoCheck &request) const {
        std::vector<std::string> arguments = {"check"};
        append_package(arguments, request.package);
        return arguments;
    }

    std::vector<std::string> operator()(const CargoClippy &request) const {
        std::vector<std::string> arguments = {"clippy"};
        append_package(arguments, request.package);
        append_flag(arguments, request.fix, "--fix");
        arguments.insert(arguments.end(), {"--", "-D", "warnings"});
        return arguments;
    }

    std::vector<std::string> operator()(const CargoTest &request) const {
        std::vector<std::string> arguments = {"test"};
        append_package(arguments, request.package);
        if (request.test_name) {
            arguments.push_back(*request.test_name);
        }
        return arguments;
    }

    std::vector<std::string> operator()(const CargoFmtCheck &) const {
        return {"fmt", "--check"};
    }

    std::vector<std::string> operator()(const CargoBuild &request) const {
        std::vector<std::string> arguments = {"build"};
        append_package(arguments, request.package);
        append_flag(arguments, request.release, "--release");
        return arguments;
    }

    std::vector<std::string> operator()(const CargoBench &request) const {
        std::vector<std::string> arguments = {"bench"};
        append_package(arguments, request.package);
        if (request.bench_name) {
            arguments.push_back(*request.bench_name);
        }
        if (request.baseline) {
            arguments.insert(arguments.end(), {"--", "--save-baseline", *request.baseline});
        }
        return arguments;
    }

    std::vector<std::string> operator()(const CargoAdd &request) const {
        std::vector<std::string> arguments = {"add"};
        append_package(arguments, request.package);
        append_flag(arguments, request.dev, "--dev");
        append_flag(arguments, request.optional, "--optional");
        if (!request.features.empty()) {
            arguments.push_back("--features");
            arguments.push_back(join(request.features, ","));
        }
        arguments.insert(arguments.end(), request.dependencies.begin(), request.dependencies.end());
        return arguments;
    }

    std::vector<std::string> operator()(const CargoRemove &request) const {
        std::vector<std::string> arguments = {"remove"};
        append_package(arguments, request.package);
        append_flag(arguments, request.dev, "--dev");
        arguments.insert(arguments.end(), request.dependencies.begin(), request.dependencies.end());
        return arguments;
    }

    std::vector<std::string> operator()(const CargoUpdate &request) const {
        std::vector<std::string> arguments = {"update"};
        append_package(arguments, request.package);
        append_flag(arguments, request.dry_run, "--dry-run");
        for (const auto &dependency : request.dependencies) {
            arguments.push_back("--package");
            arguments.push_back(dependency);
        }
        return arguments;
    }

    std::vector<std::string> operator()(const CargoClean &request) const {
        std::vector<std::string> arguments = {"clean"};
        append_package(arguments, request.package);
        return arguments;
    }

    std::vector<std::string> operator()(const CargoRun &request) const {
        std::vector<std::string> arguments = {"run"};
        append_package(arguments, request.package);
        append_option(arguments, "--bin", request.bin);
        append_option(arguments, "--example", request.example);
        append_flag(arguments, request.release, "--release");
        append_option(arguments, "--features", request.features);
        append_flag(arguments, request.all_features, "--all-features");
        append_flag(arguments, request.no_default_features, "--no-default-features");
        if (!request.args.empty()) {
            arguments.push_back("--");
            arguments.insert(arguments.end(), request.args.begin(), request.args.end());
        }
        return arguments;
    }
};

struct OperationNamer {
    std::string operator()(const CargoCheck &) const { return "cargo check"; }
    std::string operator()(const CargoClippy &) const { return "cargo clippy"; }
    std::string operator()(const CargoTest &) const { return "cargo test"; }
    std::string operator()(const CargoFmtCheck &) const { return "cargo fmt --check"; }
    std::string operator()(const CargoBuild &) const { return "cargo build"; }
    std::string operator()(const CargoBench &) const { return "cargo bench"; }
    std::string operator()(const CargoAdd &) const { return "cargo add"; }
    std::string operator()(const CargoRemove &) const { return "cargo remove"; }
    std::string operator()(const CargoUpdate &) const { return "cargo update"; }
    std::string operator()(const CargoClean &) const { return "cargo clean"; }
    std::string operator()(const CargoRun &) const { return "cargo run"; }
};

} // namespace

std::optional<std::string> resolve_toolchain(const std::optional<std::string> &requested,
                                             const std::optional<std::string> &session_default) {
    if (requested && !requested->empty()) {
        return requested;
    }
    if (session_default && !session_default->empty()) {
        return session_default;
    }
    return std::nullopt;
}

EnvironmentMap merge_environment(const EnvironmentMap &session_environment,
                                 const EnvironmentMap &call_environment) {
    EnvironmentMap merged = session_environment;
    for (const auto &variable : call_environment) {
        merged[variable.first] = variable.second;
    }
    return merged;
}

std::vector<std::string> build_cargo_arguments(const CargoRequest &request) {
    return std::visit(ArgumentBuilder{}, request);
}

std::string operation_name(const CargoRequest &request) {
    return std::visit(OperationNamer{}, request);
}

CommandSpec build_command(const CargoRequest &request,
                          const std::optional<std::string> &toolchain,
                          const EnvironmentMap &environment,
                          const std::string &working_directory) {
    CommandSpec spec;
    if (toolchain) {
        spec.program = "rustup";
        spec.arguments = {"run", *toolchain, "cargo"};
    } else {
        spec.program = "cargo";
    }

    std::vector<std::string> cargo_arguments = build_cargo_arguments(request);
    spec.arguments.insert(spec.arguments.end(), cargo_arguments.begin(), cargo_arguments.end());
    spec.environment.assign(environment.begin(), environment.end());
    spec.working_directory = working_directory;
    return spec;
}

} // namespace cargo_command
