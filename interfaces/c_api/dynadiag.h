/**
 * @file dynadiag.h
 * @brief dynadiag C API
 *
 * Runs the diagnosis pipeline on a result directory and hands the Report
 * back as JSON text, for callers that bind through a C FFI.
 *
 * Design Notes:
 * - All functions use an opaque DynadiagHandle* (callers never see C++ types)
 * - Functions that can fail return DynadiagError codes (0 = success)
 * - Last error message retrievable via dynadiag_get_last_error()
 * - A degraded run still succeeds; inspect the outcome for coverage
 */

#ifndef DYNADIAG_H
#define DYNADIAG_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Platform-specific export macros
 * ===========================================================================*/

#if defined(_WIN32) || defined(__CYGWIN__)
#ifdef DYNADIAG_C_BUILDING_DLL
#define DYNADIAG_API __declspec(dllexport)
#else
#define DYNADIAG_API __declspec(dllimport)
#endif
#else
#define DYNADIAG_API __attribute__((visibility("default")))
#endif

/* =============================================================================
 * Types
 * ===========================================================================*/

/** @brief Opaque handle to a configured diagnosis pipeline */
typedef struct DynadiagHandle DynadiagHandle;

/** @brief Error codes returned by the API functions */
typedef enum DynadiagError {
    DYNADIAG_OK = 0,                      /**< Success */
    DYNADIAG_ERROR_NULL_HANDLE = -1,      /**< NULL handle or argument */
    DYNADIAG_ERROR_CONFIG_LOAD = -2,      /**< Failed to load configuration */
    DYNADIAG_ERROR_FATAL_INPUT = -3,      /**< Required inputs missing or nothing usable */
    DYNADIAG_ERROR_ABORTED = -4,          /**< Run was cancelled */
    DYNADIAG_ERROR_NO_REPORT = -5,        /**< No successful run on this handle */
    DYNADIAG_ERROR_IO = -6,               /**< Could not write an output file */
    DYNADIAG_ERROR_UNKNOWN = -99          /**< Unknown error */
} DynadiagError;

/** @brief Outcome of the last run */
typedef enum DynadiagOutcome {
    DYNADIAG_OUTCOME_NONE = -1, /**< Nothing has run yet */
    DYNADIAG_OUTCOME_SUCCESS = 0,
    DYNADIAG_OUTCOME_DEGRADED = 1,
    DYNADIAG_OUTCOME_FATAL_INPUT = 2,
    DYNADIAG_OUTCOME_ABORTED = 3
} DynadiagOutcome;

/** @brief Finding severities, matching the Report's ordering */
typedef enum DynadiagSeverity {
    DYNADIAG_SEVERITY_INFO = 0,
    DYNADIAG_SEVERITY_WARNING = 1,
    DYNADIAG_SEVERITY_CRITICAL = 2
} DynadiagSeverity;

/* =============================================================================
 * Lifecycle Functions
 * ===========================================================================*/

/**
 * @brief Create a pipeline handle
 *
 * @param config_path YAML configuration, or NULL for the defaults
 * @return Handle, or NULL on failure (check dynadiag_get_last_error(NULL))
 */
DYNADIAG_API DynadiagHandle *dynadiag_create(const char *config_path);

/**
 * @brief Destroy a handle and free its resources
 *
 * Safe to call with NULL handle (no-op).
 */
DYNADIAG_API void dynadiag_destroy(DynadiagHandle *handle);

/**
 * @brief Diagnose one result directory
 *
 * Replaces the result of any earlier run on this handle.
 *
 * @param handle    Pipeline handle
 * @param directory LS-DYNA result directory
 * @return DYNADIAG_OK when a Report was produced (full or degraded coverage)
 */
DYNADIAG_API DynadiagError dynadiag_run(DynadiagHandle *handle, const char *directory);

/**
 * @brief Request cancellation of a run in progress
 *
 * Safe to call from another thread. The running dynadiag_run() returns
 * DYNADIAG_ERROR_ABORTED. Later runs on the handle are cancelled too.
 */
DYNADIAG_API void dynadiag_cancel(DynadiagHandle *handle);

/* =============================================================================
 * Results
 * ===========================================================================*/

/** @brief Outcome of the last run, or DYNADIAG_OUTCOME_NONE */
DYNADIAG_API DynadiagOutcome dynadiag_get_outcome(DynadiagHandle *handle);

/** @brief Process exit code for the last run's outcome (0, 2, 3 or 130), or -1 */
DYNADIAG_API int dynadiag_get_exit_code(DynadiagHandle *handle);

/**
 * @brief Report of the last run as JSON
 *
 * Caller must free the returned string with dynadiag_free_string().
 *
 * @return JSON string (caller must free), or NULL when there is no Report
 */
DYNADIAG_API const char *dynadiag_get_report_json(DynadiagHandle *handle);

/**
 * @brief Write the Report of the last run to a JSON file
 */
DYNADIAG_API DynadiagError dynadiag_write_report_json(DynadiagHandle *handle, const char *path);

/**
 * @brief Number of Findings with the given severity
 *
 * @return Count, or 0 when there is no Report
 */
DYNADIAG_API size_t dynadiag_get_finding_count(DynadiagHandle *handle,
                                               DynadiagSeverity severity);

/* =============================================================================
 * Error Handling
 * ===========================================================================*/

/**
 * @brief Get last error message
 *
 * The returned string is valid until the next API call on this handle.
 *
 * @param handle Handle (can be NULL for creation errors)
 * @return Error message string, or empty string if no error
 */
DYNADIAG_API const char *dynadiag_get_last_error(DynadiagHandle *handle);

/** @brief Error code name (e.g. "DYNADIAG_OK") */
DYNADIAG_API const char *dynadiag_error_name(DynadiagError error);

/* =============================================================================
 * Memory Management
 * ===========================================================================*/

/** @brief Free a string returned by dynadiag_get_report_json() (NULL is fine) */
DYNADIAG_API void dynadiag_free_string(const char *str);

/* =============================================================================
 * Version Information
 * ===========================================================================*/

DYNADIAG_API const char *dynadiag_version(void);

DYNADIAG_API void dynadiag_version_components(int *major, int *minor, int *patch);

#ifdef __cplusplus
}
#endif

#endif /* DYNADIAG_H */
