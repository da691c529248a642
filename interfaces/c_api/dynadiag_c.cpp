/**
 * @file dynadiag_c.cpp
 * @brief dynadiag C API implementation
 *
 * Wraps DiagnosisPipeline in a C-compatible interface.
 */

#include "dynadiag.h"

#include <dynadiag/core/Error.hpp>
#include <dynadiag/io/ConfigLoader.hpp>
#include <dynadiag/pipeline/DiagnosisPipeline.hpp>
#include <dynadiag/report/ReportJson.hpp>

#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

// Version info from CMake
#ifndef DYNADIAG_VERSION_STRING
#define DYNADIAG_VERSION_STRING "0.3.0"
#endif

// =============================================================================
// Internal Handle Structure
// =============================================================================

struct DynadiagHandle {
    dynadiag::AnalysisConfig config;
    dynadiag::CancellationToken token;
    std::optional<dynadiag::DiagnosisResult> result;
    std::string last_error;

    void SetError(const std::string &msg) { last_error = msg; }

    void ClearError() { last_error.clear(); }
};

// Thread-local storage for creation errors (before handle exists)
static thread_local std::string g_creation_error;

// =============================================================================
// Helper Functions
// =============================================================================

static DynadiagError TranslateException(DynadiagHandle *handle, const std::exception &e) {
    if (handle) {
        handle->SetError(e.what());
    }
    if (dynamic_cast<const dynadiag::ConfigError *>(&e)) {
        return DYNADIAG_ERROR_CONFIG_LOAD;
    }
    if (dynamic_cast<const dynadiag::IOError *>(&e)) {
        return DYNADIAG_ERROR_IO;
    }
    if (dynamic_cast<const dynadiag::AbortedError *>(&e)) {
        return DYNADIAG_ERROR_ABORTED;
    }
    return DYNADIAG_ERROR_UNKNOWN;
}

static DynadiagOutcome ToCOutcome(dynadiag::Outcome outcome) {
    switch (outcome) {
    case dynadiag::Outcome::Success:
        return DYNADIAG_OUTCOME_SUCCESS;
    case dynadiag::Outcome::DegradedCoverage:
        return DYNADIAG_OUTCOME_DEGRADED;
    case dynadiag::Outcome::FatalInput:
        return DYNADIAG_OUTCOME_FATAL_INPUT;
    case dynadiag::Outcome::Aborted:
        return DYNADIAG_OUTCOME_ABORTED;
    }
    return DYNADIAG_OUTCOME_FATAL_INPUT;
}

static const dynadiag::Report *ReportOf(const DynadiagHandle *handle) {
    if (!handle || !handle->result || !handle->result->report) {
        return nullptr;
    }
    return &*handle->result->report;
}

extern "C" {

// =============================================================================
// Lifecycle Functions
// =============================================================================

DYNADIAG_API DynadiagHandle *dynadiag_create(const char *config_path) {
    auto handle = std::make_unique<DynadiagHandle>();
    try {
        if (config_path) {
            handle->config = dynadiag::io::ConfigLoader::LoadFile(config_path);
        }
        g_creation_error.clear();
        return handle.release();
    } catch (const std::exception &e) {
        g_creation_error = e.what();
        return nullptr;
    }
}

DYNADIAG_API void dynadiag_destroy(DynadiagHandle *handle) {
    delete handle; // Safe if null
}

DYNADIAG_API DynadiagError dynadiag_run(DynadiagHandle *handle, const char *directory) {
    if (!handle) {
        return DYNADIAG_ERROR_NULL_HANDLE;
    }
    if (!directory) {
        handle->SetError("directory is NULL");
        return DYNADIAG_ERROR_NULL_HANDLE;
    }

    handle->ClearError();
    handle->result.reset();

    try {
        dynadiag::DiagnosisPipeline pipeline(handle->config, handle->token);
        handle->result = pipeline.Run(directory);
    } catch (const std::exception &e) {
        return TranslateException(handle, e);
    }

    switch (handle->result->outcome) {
    case dynadiag::Outcome::Success:
    case dynadiag::Outcome::DegradedCoverage:
        return DYNADIAG_OK;
    case dynadiag::Outcome::FatalInput:
        handle->SetError(handle->result->message);
        return DYNADIAG_ERROR_FATAL_INPUT;
    case dynadiag::Outcome::Aborted:
        handle->SetError(handle->result->message);
        return DYNADIAG_ERROR_ABORTED;
    }
    return DYNADIAG_ERROR_UNKNOWN;
}

DYNADIAG_API void dynadiag_cancel(DynadiagHandle *handle) {
    if (handle) {
        handle->token.RequestCancel();
    }
}

// =============================================================================
// Results
// =============================================================================

DYNADIAG_API DynadiagOutcome dynadiag_get_outcome(DynadiagHandle *handle) {
    if (!handle || !handle->result) {
        return DYNADIAG_OUTCOME_NONE;
    }
    return ToCOutcome(handle->result->outcome);
}

DYNADIAG_API int dynadiag_get_exit_code(DynadiagHandle *handle) {
    if (!handle || !handle->result) {
        return -1;
    }
    return dynadiag::ExitCode(handle->result->outcome);
}

DYNADIAG_API const char *dynadiag_get_report_json(DynadiagHandle *handle) {
    if (!handle) {
        return nullptr;
    }
    const auto *report = ReportOf(handle);
    if (!report) {
        handle->SetError("no report available");
        return nullptr;
    }

    handle->ClearError();

    try {
        std::string json = dynadiag::ReportToJSONString(*report);
        char *result = static_cast<char *>(std::malloc(json.size() + 1));
        if (!result) {
            handle->SetError("allocation failed");
            return nullptr;
        }
        std::memcpy(result, json.c_str(), json.size() + 1);
        return result;
    } catch (const std::exception &e) {
        TranslateException(handle, e);
        return nullptr;
    }
}

DYNADIAG_API DynadiagError dynadiag_write_report_json(DynadiagHandle *handle, const char *path) {
    if (!handle) {
        return DYNADIAG_ERROR_NULL_HANDLE;
    }
    if (!path) {
        handle->SetError("path is NULL");
        return DYNADIAG_ERROR_NULL_HANDLE;
    }
    const auto *report = ReportOf(handle);
    if (!report) {
        handle->SetError("no report available");
        return DYNADIAG_ERROR_NO_REPORT;
    }

    handle->ClearError();

    try {
        dynadiag::WriteReportJSON(*report, path);
        return DYNADIAG_OK;
    } catch (const std::exception &e) {
        return TranslateException(handle, e);
    }
}

DYNADIAG_API size_t dynadiag_get_finding_count(DynadiagHandle *handle,
                                               DynadiagSeverity severity) {
    const auto *report = ReportOf(handle);
    if (!report) {
        return 0;
    }
    switch (severity) {
    case DYNADIAG_SEVERITY_INFO:
        return report->Count(dynadiag::FindingSeverity::Info);
    case DYNADIAG_SEVERITY_WARNING:
        return report->Count(dynadiag::FindingSeverity::Warning);
    case DYNADIAG_SEVERITY_CRITICAL:
        return report->Count(dynadiag::FindingSeverity::Critical);
    }
    return 0;
}

// =============================================================================
// Error Handling
// =============================================================================

DYNADIAG_API const char *dynadiag_get_last_error(DynadiagHandle *handle) {
    if (!handle) {
        return g_creation_error.c_str();
    }
    return handle->last_error.c_str();
}

DYNADIAG_API const char *dynadiag_error_name(DynadiagError error) {
    switch (error) {
    case DYNADIAG_OK:
        return "DYNADIAG_OK";
    case DYNADIAG_ERROR_NULL_HANDLE:
        return "DYNADIAG_ERROR_NULL_HANDLE";
    case DYNADIAG_ERROR_CONFIG_LOAD:
        return "DYNADIAG_ERROR_CONFIG_LOAD";
    case DYNADIAG_ERROR_FATAL_INPUT:
        return "DYNADIAG_ERROR_FATAL_INPUT";
    case DYNADIAG_ERROR_ABORTED:
        return "DYNADIAG_ERROR_ABORTED";
    case DYNADIAG_ERROR_NO_REPORT:
        return "DYNADIAG_ERROR_NO_REPORT";
    case DYNADIAG_ERROR_IO:
        return "DYNADIAG_ERROR_IO";
    case DYNADIAG_ERROR_UNKNOWN:
    default:
        return "DYNADIAG_ERROR_UNKNOWN";
    }
}

// =============================================================================
// Memory Management
// =============================================================================

DYNADIAG_API void dynadiag_free_string(const char *str) {
    std::free(const_cast<char *>(str)); // Safe if null
}

// =============================================================================
// Version
// =============================================================================

DYNADIAG_API const char *dynadiag_version(void) { return DYNADIAG_VERSION_STRING; }

DYNADIAG_API void dynadiag_version_components(int *major, int *minor, int *patch) {
    if (major) {
        *major = DYNADIAG_VERSION_MAJOR;
    }
    if (minor) {
        *minor = DYNADIAG_VERSION_MINOR;
    }
    if (patch) {
        *patch = DYNADIAG_VERSION_PATCH;
    }
}

} // extern "C"
