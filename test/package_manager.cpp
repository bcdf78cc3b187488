//
// Copyright kiln developers 2026 - .
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
//

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <boost/chrono.hpp>
#include <boost/filesystem.hpp>

#include "execution_runtime.hpp"
#include "fake_engine.hpp"
#include "package_manager.hpp"

namespace fs = boost::filesystem;

using kiln::container_spec;
using kiln::execution_error;
using kiln::package_list_status;
using kiln::test::exits_with;
using kiln::test::fake_engine;
using strings = std::vector<std::string>;

namespace {

auto operations(std::string const& language) -> kiln::package_operations const& {
    auto const ops = kiln::resolve_package_operations(language);
    if (!ops) {
        throw std::runtime_error("no package operations for " + language);
    }
    return *ops;
}

class package_manager : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / fs::unique_path("kiln-packages-%%%%-%%%%-%%%%");
        engine_ = std::make_shared<fake_engine>();

        auto opts = kiln::default_runtime_options();
        opts.staging_root = root_;
        opts.execution_timeout = boost::chrono::milliseconds(2000);
        opts.output_drain_timeout = boost::chrono::milliseconds(200);
        opts.warm_images = {};
        runtime_.reset(new kiln::execution_runtime(engine_, opts));
        pm_.reset(new kiln::package_manager(*runtime_));
    }

    void TearDown() override {
        pm_.reset();
        runtime_.reset();

        boost::system::error_code ec;
        fs::remove_all(root_, ec);
    }

    // command line that reached the container: sh -c <line>
    auto last_shell_line() -> std::string {
        auto const specs = engine_->created_specs();
        if (specs.empty() || specs.back().commands.size() != 3) {
            return "";
        }
        return specs.back().commands[2];
    }

    fs::path root_;
    std::shared_ptr<fake_engine> engine_;
    std::unique_ptr<kiln::execution_runtime> runtime_;
    std::unique_ptr<kiln::package_manager> pm_;
};

} // namespace

TEST_F(package_manager, install_python_package) {
    auto const r = pm_->install_packages({"p1", "python", {"six"}, boost::none});

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.installed_packages, strings{"six"});
    EXPECT_FALSE(r.error);

    auto const specs = engine_->created_specs();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].image, "python:3.11-alpine");
    EXPECT_EQ(specs[0].commands[0], "sh");
    EXPECT_EQ(specs[0].commands[1], "-c");
    EXPECT_EQ(
        specs[0].commands[2], "pip install --user 'six' && pip freeze --user > requirements.txt"
    );
    EXPECT_EQ(specs[0].network_mode, "bridge");
    EXPECT_EQ(specs[0].mount.host_path, root_ / "p1");
}

TEST_F(package_manager, install_failure_reports_no_packages) {
    engine_->set_script([](container_spec const&) {
        return exits_with(1, "", "ERROR: No matching distribution found for nope-pkg\n");
    });

    auto const r = pm_->install_packages({"p1", "python", {"nope-pkg"}, boost::none});

    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.installed_packages.empty());
    EXPECT_NE(r.stderr_text.find("No matching distribution"), std::string::npos);
    EXPECT_NE(r.message.find("exited with code 1"), std::string::npos);
}

TEST_F(package_manager, install_npm_packages_with_versions) {
    auto const r = pm_->install_packages({"p1", "javascript", {"lodash@4.17.21", "@types/node"}, boost::none});

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.installed_packages, (strings{"lodash@4.17.21", "@types/node"}));
    EXPECT_EQ(last_shell_line(), "npm install --save 'lodash@4.17.21' '@types/node'");
}

TEST_F(package_manager, invalid_specifiers_are_rejected_before_execution) {
    for (auto const* bad : {"-e", "--index-url=http://evil", "six; rm -rf /", "a b", "$(id)", ""}) {
        auto const r = pm_->install_packages({"p1", "python", {"six", bad}, boost::none});

        EXPECT_FALSE(r.success) << bad;
        ASSERT_TRUE(r.error) << bad;
        EXPECT_EQ(*r.error, execution_error::validation_failed) << bad;
    }

    auto const empty = pm_->install_packages({"p1", "python", {}, boost::none});
    EXPECT_FALSE(empty.success);

    EXPECT_EQ(engine_->calls(), 0u);
}

TEST_F(package_manager, specifier_validation) {
    EXPECT_TRUE(kiln::is_valid_package_specifier("requests==2.31.0"));
    EXPECT_TRUE(kiln::is_valid_package_specifier("numpy>=1.20"));
    EXPECT_TRUE(kiln::is_valid_package_specifier("github.com/gorilla/mux@v1.8.0"));
    EXPECT_TRUE(kiln::is_valid_package_specifier("serde@^1.0"));
    EXPECT_TRUE(kiln::is_valid_package_specifier("@scope/pkg~1.2"));
    EXPECT_TRUE(kiln::is_valid_package_specifier("requests[socks]"));
    EXPECT_TRUE(kiln::is_valid_package_specifier("django>=3,<4"));

    EXPECT_FALSE(kiln::is_valid_package_specifier("-r"));
    EXPECT_FALSE(kiln::is_valid_package_specifier("a&&b"));
    EXPECT_FALSE(kiln::is_valid_package_specifier("a|b"));
    EXPECT_FALSE(kiln::is_valid_package_specifier("a'b"));
}

TEST_F(package_manager, install_pip_extras_and_ranges) {
    auto const r = pm_->install_packages({"p1", "python", {"requests[socks]", "django>=3,<4"}, boost::none});

    EXPECT_TRUE(r.success);
    EXPECT_EQ(
        last_shell_line(),
        "pip install --user 'requests[socks]' 'django>=3,<4' && pip freeze --user > requirements.txt"
    );
}

TEST_F(package_manager, unsupported_language) {
    auto const r = pm_->install_packages({"p1", "java", {"junit"}, boost::none});

    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.error);
    EXPECT_EQ(*r.error, execution_error::unsupported_language);

    EXPECT_EQ(pm_->get_installed_packages("p1", "cobol").status, package_list_status::unsupported_language);
    EXPECT_EQ(engine_->calls(), 0u);
}

TEST_F(package_manager, list_npm_dependency_map) {
    engine_->set_script([](container_spec const&) {
        return exits_with(
            0, R"({"name":"app","dependencies":{"lodash":{"version":"4.17.21"},"express":{"version":"4.18.2"}}})"
        );
    });

    auto const r = pm_->get_installed_packages("p1", "javascript");

    EXPECT_EQ(r.status, package_list_status::ok);
    EXPECT_EQ(r.packages, (strings{"express", "lodash"}));
    EXPECT_EQ(last_shell_line(), "npm ls --depth=0 --json");
}

TEST_F(package_manager, list_with_non_zero_exit_but_complete_output) {
    engine_->set_script([](container_spec const&) {
        return exits_with(1, R"({"dependencies":{"left-pad":{}}})", "npm ERR! extraneous: x\n");
    });

    auto const r = pm_->get_installed_packages("p1", "typescript");

    EXPECT_EQ(r.status, package_list_status::ok);
    EXPECT_EQ(r.packages, strings{"left-pad"});
}

TEST_F(package_manager, list_pip_package_array) {
    engine_->set_script([](container_spec const&) {
        return exits_with(0, R"([{"name":"six","version":"1.16.0"},{"name":"requests","version":"2.31.0"}])");
    });

    auto const r = pm_->get_installed_packages("p1", "python");

    EXPECT_EQ(r.status, package_list_status::ok);
    EXPECT_EQ(r.packages, (strings{"six", "requests"}));
    EXPECT_EQ(pm_->installed_package_names("p1", "python"), (strings{"six", "requests"}));
}

TEST_F(package_manager, unparseable_output_is_distinct_from_empty) {
    engine_->set_script([](container_spec const&) { return exits_with(0, "WARNING: something odd\n"); });

    auto const r = pm_->get_installed_packages("p1", "python");
    EXPECT_EQ(r.status, package_list_status::unparseable);
    EXPECT_TRUE(r.packages.empty());
    EXPECT_EQ(r.raw_output, "WARNING: something odd\n");

    EXPECT_TRUE(pm_->installed_package_names("p1", "python").empty());

    engine_->set_script([](container_spec const&) { return exits_with(0, "[]"); });
    auto const empty = pm_->get_installed_packages("p1", "python");
    EXPECT_EQ(empty.status, package_list_status::ok);
    EXPECT_TRUE(empty.packages.empty());
}

TEST_F(package_manager, failed_list_command) {
    engine_->set_script([](container_spec const&) { return exits_with(127, "", "sh: pip: not found\n"); });

    auto const r = pm_->get_installed_packages("p1", "python");
    EXPECT_EQ(r.status, package_list_status::execution_failed);

    engine_->reachable = false;
    EXPECT_EQ(pm_->get_installed_packages("p1", "python").status, package_list_status::execution_failed);
}

TEST_F(package_manager, remove_go_module_uses_none_version) {
    auto const r = pm_->remove_packages("p1", "go", {"github.com/gorilla/mux"});

    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.installed_packages, strings{"github.com/gorilla/mux"});
    EXPECT_EQ(last_shell_line(), "go get 'github.com/gorilla/mux@none'");
}

TEST_F(package_manager, initialize_project) {
    auto const r = pm_->initialize_project("p1", "go");

    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.installed_packages.empty());
    EXPECT_EQ(last_shell_line(), "go mod init 'p1'");

    EXPECT_FALSE(pm_->initialize_project("p1", "c").success);
}

TEST_F(package_manager, initialize_project_runs_language_setup) {
    auto const r = pm_->initialize_project("p1", "typescript");

    EXPECT_TRUE(r.success);
    EXPECT_EQ(last_shell_line(), "npm init -y && npm install --save-dev tsx");
    EXPECT_EQ(engine_->created_specs().back().network_mode, "bridge");

    pm_->initialize_project("p1", "python");
    EXPECT_EQ(last_shell_line(), "touch requirements.txt");
}

TEST_F(package_manager, package_files) {
    EXPECT_EQ(pm_->get_package_file("javascript").value_or(""), "package.json");
    EXPECT_EQ(pm_->get_package_file("python").value_or(""), "requirements.txt");
    EXPECT_EQ(pm_->get_package_file("go").value_or(""), "go.mod");
    EXPECT_EQ(pm_->get_package_file("rust").value_or(""), "Cargo.toml");
    EXPECT_FALSE(pm_->get_package_file("java"));

    EXPECT_EQ(pm_->get_supported_languages(), (strings{"javascript", "typescript", "python", "go", "rust"}));
}

TEST(parse_package_list, go_module_lines) {
    auto const out =
        "example.com/app\n"
        "github.com/gorilla/mux v1.8.0\n"
        "go: downloading golang.org/x/text v0.3.0\n"
        "\n"
        "golang.org/x/text v0.3.0 // indirect\n";

    auto const packages = kiln::parse_package_list(operations("go"), out);
    ASSERT_TRUE(packages);
    EXPECT_EQ(*packages, (strings{"github.com/gorilla/mux", "golang.org/x/text"}));
}

TEST(parse_package_list, cargo_tree_lines) {
    auto const out =
        "app v0.1.0 (/workspace)\n"
        "serde v1.0.190\n"
        "rand v0.8.5\n";

    auto const packages = kiln::parse_package_list(operations("rust"), out);
    ASSERT_TRUE(packages);
    EXPECT_EQ(*packages, (strings{"serde", "rand"}));
}

TEST(parse_package_list, json_shapes) {
    auto const& npm = operations("javascript");
    EXPECT_EQ(*kiln::parse_package_list(npm, R"({"name":"app"})"), strings{});
    EXPECT_FALSE(kiln::parse_package_list(npm, R"({"dependencies":[]})"));
    EXPECT_FALSE(kiln::parse_package_list(npm, "[]"));

    auto const& pip = operations("python");
    EXPECT_FALSE(kiln::parse_package_list(pip, R"([{"version":"1.0"}])"));
    EXPECT_FALSE(kiln::parse_package_list(pip, R"({"name":"six"})"));
    EXPECT_FALSE(kiln::parse_package_list(pip, ""));
}
