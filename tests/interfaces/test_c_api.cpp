/**
 * @file test_c_api.cpp
 * @brief Tests for the dynadiag C API
 */

#include <dynadiag.h>

#include <Fixtures.hpp>
#include <TempRunDir.hpp>

#include <gtest/gtest.h>

#include <cstring>
#include <string>

using namespace dynadiag;

namespace {

/// d3hsp plus glstat: enough for a Report, short of full coverage
void WritePartialRun(const fixtures::TempRunDir &dir) {
    dir.Write("d3hsp", fixtures::HspNormalRun(4));
    dir.Write("glstat", fixtures::GlstatText(fixtures::HealthyGlstat()));
}

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST(CApi, CreateWithDefaults) {
    DynadiagHandle *handle = dynadiag_create(nullptr);
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(dynadiag_get_outcome(handle), DYNADIAG_OUTCOME_NONE);
    EXPECT_EQ(dynadiag_get_exit_code(handle), -1);
    EXPECT_STREQ(dynadiag_get_last_error(handle), "");
    dynadiag_destroy(handle);
    dynadiag_destroy(nullptr);
}

TEST(CApi, CreateWithConfigFile) {
    fixtures::TempRunDir dir;
    auto good = dir.Write("good.yaml", "analysis:\n  tracked_node_cap: 10\n");
    DynadiagHandle *handle = dynadiag_create(good.c_str());
    ASSERT_NE(handle, nullptr) << dynadiag_get_last_error(nullptr);
    dynadiag_destroy(handle);

    auto bad = dir.Write("bad.yaml", "analysis:\n  zcr_window: 2\n");
    EXPECT_EQ(dynadiag_create(bad.c_str()), nullptr);
    EXPECT_NE(std::string(dynadiag_get_last_error(nullptr)).find("window"), std::string::npos);

    EXPECT_EQ(dynadiag_create((dir.Path() / "absent.yaml").c_str()), nullptr);
    EXPECT_NE(std::string(dynadiag_get_last_error(nullptr)).find("cannot open"),
              std::string::npos);
}

TEST(CApi, NullArguments) {
    EXPECT_EQ(dynadiag_run(nullptr, "/tmp"), DYNADIAG_ERROR_NULL_HANDLE);
    EXPECT_EQ(dynadiag_get_report_json(nullptr), nullptr);
    EXPECT_EQ(dynadiag_get_finding_count(nullptr, DYNADIAG_SEVERITY_CRITICAL), 0u);

    DynadiagHandle *handle = dynadiag_create(nullptr);
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(dynadiag_run(handle, nullptr), DYNADIAG_ERROR_NULL_HANDLE);
    EXPECT_EQ(dynadiag_write_report_json(handle, nullptr), DYNADIAG_ERROR_NULL_HANDLE);
    dynadiag_free_string(nullptr);
    dynadiag_destroy(handle);
}

// =============================================================================
// Running
// =============================================================================

TEST(CApi, DegradedRunStillSucceeds) {
    fixtures::TempRunDir dir;
    WritePartialRun(dir);

    DynadiagHandle *handle = dynadiag_create(nullptr);
    ASSERT_NE(handle, nullptr);
    ASSERT_EQ(dynadiag_run(handle, dir.Path().c_str()), DYNADIAG_OK)
        << dynadiag_get_last_error(handle);
    EXPECT_EQ(dynadiag_get_outcome(handle), DYNADIAG_OUTCOME_DEGRADED);
    EXPECT_EQ(dynadiag_get_exit_code(handle), 3);
    EXPECT_GT(dynadiag_get_finding_count(handle, DYNADIAG_SEVERITY_INFO), 0u);

    const char *json = dynadiag_get_report_json(handle);
    ASSERT_NE(json, nullptr);
    std::string text(json);
    dynadiag_free_string(json);
    EXPECT_NE(text.find("\"tool_version\""), std::string::npos);
    EXPECT_NE(text.find("\"degraded\": true"), std::string::npos);

    auto out = dir.Path() / "report.json";
    EXPECT_EQ(dynadiag_write_report_json(handle, out.c_str()), DYNADIAG_OK);
    EXPECT_TRUE(std::filesystem::exists(out));
    EXPECT_EQ(dynadiag_write_report_json(handle, (dir.Path() / "no" / "r.json").c_str()),
              DYNADIAG_ERROR_IO);
    EXPECT_NE(std::string(dynadiag_get_last_error(handle)).find("IO"), std::string::npos);

    dynadiag_destroy(handle);
}

TEST(CApi, FatalInputLeavesNoReport) {
    fixtures::TempRunDir dir;
    dir.Write("glstat", fixtures::GlstatText(fixtures::HealthyGlstat()));

    DynadiagHandle *handle = dynadiag_create(nullptr);
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(dynadiag_run(handle, dir.Path().c_str()), DYNADIAG_ERROR_FATAL_INPUT);
    EXPECT_EQ(dynadiag_get_outcome(handle), DYNADIAG_OUTCOME_FATAL_INPUT);
    EXPECT_EQ(dynadiag_get_exit_code(handle), 2);
    EXPECT_NE(std::string(dynadiag_get_last_error(handle)).find("d3hsp"), std::string::npos);

    EXPECT_EQ(dynadiag_get_report_json(handle), nullptr);
    EXPECT_EQ(dynadiag_write_report_json(handle, (dir.Path() / "r.json").c_str()),
              DYNADIAG_ERROR_NO_REPORT);
    dynadiag_destroy(handle);
}

TEST(CApi, CancelledHandleAborts) {
    fixtures::TempRunDir dir;
    WritePartialRun(dir);

    DynadiagHandle *handle = dynadiag_create(nullptr);
    ASSERT_NE(handle, nullptr);
    dynadiag_cancel(handle);
    EXPECT_EQ(dynadiag_run(handle, dir.Path().c_str()), DYNADIAG_ERROR_ABORTED);
    EXPECT_EQ(dynadiag_get_outcome(handle), DYNADIAG_OUTCOME_ABORTED);
    EXPECT_EQ(dynadiag_get_exit_code(handle), 130);
    dynadiag_destroy(handle);
}

// =============================================================================
// Names and version
// =============================================================================

TEST(CApi, ErrorNames) {
    EXPECT_STREQ(dynadiag_error_name(DYNADIAG_OK), "DYNADIAG_OK");
    EXPECT_STREQ(dynadiag_error_name(DYNADIAG_ERROR_FATAL_INPUT), "DYNADIAG_ERROR_FATAL_INPUT");
    EXPECT_STREQ(dynadiag_error_name(static_cast<DynadiagError>(42)), "DYNADIAG_ERROR_UNKNOWN");
}

TEST(CApi, Version) {
    int major = -1;
    int minor = -1;
    int patch = -1;
    dynadiag_version_components(&major, &minor, &patch);
    EXPECT_EQ(std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch),
              std::string(dynadiag_version()));
    dynadiag_version_components(nullptr, nullptr, nullptr);
}
