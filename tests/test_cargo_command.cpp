// Tests for toolchain resolution, environment merging and argument construction.

#include "cargo/cargo_command.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using namespace cargo_requests;
using cargo_command::build_cargo_arguments;
using test_helpers::check;

namespace test_cargo_command {

using Arguments = std::vector<std::string>;

static bool test_toolchain_precedence() {
    using cargo_command::resolve_toolchain;
    const std::optional<std::string> none;

    bool all_passed = true;
    all_passed &= check(resolve_toolchain(std::string("nightly"), std::string("stable")) ==
                            std::optional<std::string>("nightly"),
                        "Per-call toolchain wins over the session default");
    all_passed &= check(resolve_toolchain(none, std::string("stable")) == std::optional<std::string>("stable"),
                        "Session default applies when no toolchain is given");
    all_passed &= check(!resolve_toolchain(none, none), "No toolchain when neither is set");
    all_passed &= check(resolve_toolchain(std::string(""), std::string("beta")) == std::optional<std::string>("beta"),
                        "Empty per-call toolchain counts as none");
    all_passed &= check(!resolve_toolchain(std::string(""), std::string("")),
                        "Empty session default counts as none");
    return all_passed;
}

static bool test_environment_merge() {
    EnvironmentMap merged = cargo_command::merge_environment({{"A", "1"}}, {{"A", "2"}, {"B", "3"}});
    return check(merged == EnvironmentMap{{"A", "2"}, {"B", "3"}},
                 "Per-call environment overrides the session environment");
}

static bool test_simple_commands() {
    CargoCheck check_request;
    check_request.package = "core";
    CargoBuild build_request;
    build_request.release = true;
    CargoClean clean_request;

    bool all_passed = true;
    all_passed &= check(build_cargo_arguments(check_request) == Arguments{"check", "--package", "core"},
                        "cargo check --package");
    all_passed &= check(build_cargo_arguments(build_request) == Arguments{"build", "--release"},
                        "cargo build --release");
    all_passed &= check(build_cargo_arguments(CargoFmtCheck{}) == Arguments{"fmt", "--check"},
                        "cargo fmt --check");
    all_passed &= check(build_cargo_arguments(clean_request) == Arguments{"clean"}, "cargo clean");
    return all_passed;
}

static bool test_clippy_denies_warnings() {
    CargoClippy request;
    request.package = "app";
    request.fix = true;
    return check(build_cargo_arguments(request) == Arguments{"clippy", "--package", "app", "--fix", "--", "-D", "warnings"},
                 "cargo clippy puts flags before -- -D warnings");
}

static bool test_test_and_bench_names() {
    CargoTest test_request;
    test_request.package = "app";
    test_request.test_name = "parses_header";

    CargoBench bench_request;
    bench_request.bench_name = "throughput";
    bench_request.baseline = "main";

    CargoBench plain_bench;

    bool all_passed = true;
    all_passed &= check(build_cargo_arguments(test_request) == Arguments{"test", "--package", "app", "parses_header"},
                        "cargo test with package and test name");
    all_passed &= check(build_cargo_arguments(bench_request) ==
                            Arguments{"bench", "throughput", "--", "--save-baseline", "main"},
                        "cargo bench with name and baseline");
    all_passed &= check(build_cargo_arguments(plain_bench) == Arguments{"bench"}, "cargo bench without options");
    return all_passed;
}

static bool test_dependency_commands() {
    CargoAdd add_request;
    add_request.dependencies = {"serde", "tokio@1"};
    add_request.dev = true;
    add_request.optional = true;
    add_request.features = {"derive", "rt"};

    CargoRemove remove_request;
    remove_request.dependencies = {"log"};
    remove_request.package = "app";
    remove_request.dev = true;

    CargoUpdate update_request;
    update_request.dependencies = {"serde", "rand"};
    update_request.dry_run = true;

    bool all_passed = true;
    all_passed &= check(build_cargo_arguments(add_request) ==
                            Arguments{"add", "--dev", "--optional", "--features", "derive,rt", "serde", "tokio@1"},
                        "cargo add flags, joined features, then dependencies");
    all_passed &= check(build_cargo_arguments(remove_request) == Arguments{"remove", "--package", "app", "--dev", "log"},
                        "cargo remove flags then dependencies");
    all_passed &= check(build_cargo_arguments(update_request) ==
                            Arguments{"update", "--dry-run", "--package", "serde", "--package", "rand"},
                        "cargo update selects each dependency with --package");
    return all_passed;
}

static bool test_run_passthrough() {
    CargoRun request;
    request.package = "app";
    request.bin = "server";
    request.release = true;
    request.features = "tls,metrics";
    request.no_default_features = true;
    request.args = {"--port", "8080", "--"};

    Arguments arguments = build_cargo_arguments(request);

    CargoRun bare_request;
    bare_request.example = "demo";
    bare_request.all_features = true;

    bool all_passed = true;
    all_passed &= check(arguments == Arguments{"run", "--package", "app", "--bin", "server", "--release",
                                               "--features", "tls,metrics", "--no-default-features",
                                               "--", "--port", "8080", "--"},
                        "cargo run flags, one separator, then passthrough arguments verbatim");
    all_passed &= check(build_cargo_arguments(bare_request) == Arguments{"run", "--example", "demo", "--all-features"},
                        "cargo run without args has no separator");
    return all_passed;
}

static bool test_toolchain_prefix() {
    CargoCheck request;
    cargo_command::CommandSpec with_toolchain =
        cargo_command::build_command(request, std::string("nightly"), {{"RUST_LOG", "debug"}}, "/work/app");
    cargo_command::CommandSpec without_toolchain =
        cargo_command::build_command(request, std::nullopt, {}, "/work/app");

    bool all_passed = true;
    all_passed &= check(with_toolchain.program == "rustup" &&
                            with_toolchain.arguments == Arguments{"run", "nightly", "cargo", "check"},
                        "Toolchain runs cargo through rustup run");
    all_passed &= check(with_toolchain.environment.size() == 1 && with_toolchain.environment[0].first == "RUST_LOG" &&
                            with_toolchain.working_directory == "/work/app",
                        "Command carries environment and working directory");
    all_passed &= check(without_toolchain.program == "cargo" && without_toolchain.arguments == Arguments{"check"},
                        "Without a toolchain cargo runs directly");
    return all_passed;
}

static bool test_operation_names() {
    return check(cargo_command::operation_name(CargoFmtCheck{}) == "cargo fmt --check" &&
                     cargo_command::operation_name(CargoRun{}) == "cargo run",
                 "Operation names for report headers");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_toolchain_precedence();
    all_passed &= test_environment_merge();
    all_passed &= test_simple_commands();
    all_passed &= test_clippy_denies_warnings();
    all_passed &= test_test_and_bench_names();
    all_passed &= test_dependency_commands();
    all_passed &= test_run_passthrough();
    all_passed &= test_toolchain_prefix();
    all_passed &= test_operation_names();
    return all_passed;
}

} // namespace test_cargo_command
