#include <gtest/gtest.h>
#include "dependency_detector.h"
#include "environment_registry.h"

namespace cloudrun {
namespace {

// ============================================================================
// Python Detection Tests
// ============================================================================

TEST(DependencyDetectorTest, PythonModuleNotFound) {
    // Given: A typical traceback
    std::string output =
        "Traceback (most recent call last):\n"
        "  File \"/workspace/main.py\", line 1, in <module>\n"
        "    import requests\n"
        "ModuleNotFoundError: No module named 'requests'\n";

    // When: Detecting
    auto match = DependencyDetector::detect(output, "python");

    // Then: The package is named with pip as its manager
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->module_name, "requests");
    EXPECT_EQ(match->package_name, "requests");
    EXPECT_EQ(match->package_manager, "pip");
}

TEST(DependencyDetectorTest, PythonSubmoduleMapsToTopLevel) {
    auto match = DependencyDetector::detect(
        "ModuleNotFoundError: No module named 'google.cloud.storage'", "python");

    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->module_name, "google.cloud.storage");
    EXPECT_EQ(match->package_name, "google");
}

TEST(DependencyDetectorTest, PythonImportNamesDifferingFromPackages) {
    struct Case { const char* module; const char* package; };
    for (const auto& c : {Case{"cv2", "opencv-python"}, Case{"PIL", "Pillow"},
                          Case{"sklearn", "scikit-learn"}, Case{"yaml", "PyYAML"},
                          Case{"bs4", "beautifulsoup4"}}) {
        std::string output = std::string("ModuleNotFoundError: No module named '") +
                             c.module + "'";
        auto match = DependencyDetector::detect(output, "python");
        ASSERT_TRUE(match.has_value()) << c.module;
        EXPECT_EQ(match->package_name, c.package) << c.module;
        EXPECT_EQ(match->module_name, c.module);
    }
}

TEST(DependencyDetectorTest, PythonLegacyImportError) {
    auto match = DependencyDetector::detect("ImportError: No module named numpy\n", "python");

    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->package_name, "numpy");
}

TEST(DependencyDetectorTest, RepeatedMentionsCountOnce) {
    std::string output =
        "ModuleNotFoundError: No module named 'pandas'\n"
        "During handling of the above exception...\n"
        "ModuleNotFoundError: No module named 'pandas'\n";

    auto match = DependencyDetector::detect(output, "python");

    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->package_name, "pandas");
}

TEST(DependencyDetectorTest, AmbiguousOutputYieldsNothing) {
    // Given: Two different missing packages
    std::string output =
        "ModuleNotFoundError: No module named 'pandas'\n"
        "ModuleNotFoundError: No module named 'numpy'\n";

    // Then: No single answer, but both are suggested in order
    EXPECT_FALSE(DependencyDetector::detect(output, "python").has_value());
    auto all = DependencyDetector::suggest(output, "python");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].package_name, "pandas");
    EXPECT_EQ(all[1].package_name, "numpy");
}

// ============================================================================
// Node Detection Tests
// ============================================================================

TEST(DependencyDetectorTest, NodeCannotFindModule) {
    std::string output =
        "node:internal/modules/cjs/loader:1080\n"
        "Error: Cannot find module 'lodash'\n"
        "Require stack:\n- /workspace/main.js\n";

    auto match = DependencyDetector::detect(output, "nodejs");

    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->package_name, "lodash");
    EXPECT_EQ(match->package_manager, "npm");
}

TEST(DependencyDetectorTest, NodeSubpathAndScopedNames) {
    auto sub = DependencyDetector::detect("Error: Cannot find module 'lodash/fp'", "nodejs");
    ASSERT_TRUE(sub.has_value());
    EXPECT_EQ(sub->module_name, "lodash/fp");
    EXPECT_EQ(sub->package_name, "lodash");

    auto scoped = DependencyDetector::detect(
        "Error: Cannot find module '@babel/core/lib/index.js'", "nodejs");
    ASSERT_TRUE(scoped.has_value());
    EXPECT_EQ(scoped->package_name, "@babel/core");
}

TEST(DependencyDetectorTest, NodeEsmPackage) {
    auto match = DependencyDetector::detect(
        "Error [ERR_MODULE_NOT_FOUND]: Cannot find package 'express' imported from /workspace/main.js",
        "nodejs");

    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->package_name, "express");
}

TEST(DependencyDetectorTest, NodeLocalFilesAreNotPackages) {
    EXPECT_FALSE(DependencyDetector::detect("Error: Cannot find module './helper'", "nodejs").has_value());
    EXPECT_FALSE(DependencyDetector::detect("Error: Cannot find module '/workspace/x.js'",
                                            "nodejs").has_value());
    EXPECT_FALSE(DependencyDetector::detect("Error: Cannot find module 'node:fs'", "nodejs").has_value());
}

// ============================================================================
// Negative Tests
// ============================================================================

TEST(DependencyDetectorTest, UnrelatedErrors) {
    EXPECT_FALSE(DependencyDetector::detect("NameError: name 'x' is not defined", "python").has_value());
    EXPECT_FALSE(DependencyDetector::detect("", "python").has_value());
    EXPECT_FALSE(DependencyDetector::detect("SyntaxError: Unexpected token", "nodejs").has_value());
}

TEST(DependencyDetectorTest, LanguagesWithoutPackageManager) {
    // Python-looking output from a shell script is not acted on
    EXPECT_FALSE(DependencyDetector::detect("ModuleNotFoundError: No module named 'requests'",
                                            "ubuntu").has_value());
    EXPECT_FALSE(DependencyDetector::detect("error: package org.json does not exist", "java").has_value());
    EXPECT_EQ(DependencyDetector::package_manager_for("cpp"), "");
    EXPECT_EQ(DependencyDetector::package_manager_for("python"), "pip");
}

// ============================================================================
// Install Command Tests
// ============================================================================

TEST(DependencyDetectorTest, InstallCommandQuotesPackages) {
    auto python = BuiltInEnvironments::python();

    std::string command = DependencyDetector::install_command(python, {"requests", "numpy==1.26"});

    EXPECT_EQ(command,
              "pip install --no-cache-dir --disable-pip-version-check "
              "--target /workspace/.packages 'requests' 'numpy==1.26'");
}

TEST(DependencyDetectorTest, InstallCommandForNode) {
    auto node = BuiltInEnvironments::nodejs();

    EXPECT_EQ(DependencyDetector::install_command(node, {"@babel/core"}),
              "npm install --no-audit --no-fund --prefix /workspace '@babel/core'");
}

TEST(DependencyDetectorTest, InstallCommandEmptyWhenUnsupported) {
    EXPECT_EQ(DependencyDetector::install_command(BuiltInEnvironments::cpp(), {"boost"}), "");
    EXPECT_EQ(DependencyDetector::install_command(BuiltInEnvironments::python(), {}), "");
}

TEST(DependencyDetectorTest, ShellQuoteEscapesQuotes) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(DependencyDetectorTest, PackageNameValidation) {
    EXPECT_TRUE(DependencyDetector::is_valid_package_name("requests"));
    EXPECT_TRUE(DependencyDetector::is_valid_package_name("numpy>=1.26"));
    EXPECT_TRUE(DependencyDetector::is_valid_package_name("@types/node"));
    EXPECT_FALSE(DependencyDetector::is_valid_package_name(""));
    EXPECT_FALSE(DependencyDetector::is_valid_package_name("-e"))
        << "Names must not look like options";
    EXPECT_FALSE(DependencyDetector::is_valid_package_name("x; rm -rf /"));
    EXPECT_FALSE(DependencyDetector::is_valid_package_name("$(id)"));
}

} // namespace
} // namespace cloudrun
