#pragma once

/**
 * @file dynadiag.hpp
 * @brief Umbrella header for the dynadiag LS-DYNA run diagnosis library
 *
 * Include this header to get the pipeline, the readers, the analyzers and
 * the report exporters.
 */

// Core
#include <dynadiag/core/CoreTypes.hpp>
#include <dynadiag/core/Error.hpp>

// I/O
#include <dynadiag/io/AnalysisConfig.hpp>
#include <dynadiag/io/ConfigLoader.hpp>
#include <dynadiag/io/Console.hpp>
#include <dynadiag/io/ErrorHandler.hpp>
#include <dynadiag/io/LogService.hpp>
#include <dynadiag/io/LogSink.hpp>
#include <dynadiag/io/RunBundle.hpp>
#include <dynadiag/io/report/DiagnosisDebrief.hpp>

// Readers
#include <dynadiag/readers/BndoutReader.hpp>
#include <dynadiag/readers/GlstatReader.hpp>
#include <dynadiag/readers/HspReader.hpp>
#include <dynadiag/readers/KeywordDeckReader.hpp>
#include <dynadiag/readers/MatsumReader.hpp>
#include <dynadiag/readers/MessageReader.hpp>
#include <dynadiag/readers/NodoutReader.hpp>
#include <dynadiag/readers/ProfileReader.hpp>
#include <dynadiag/readers/StatusReader.hpp>

// Model
#include <dynadiag/model/ElementPartMapper.hpp>
#include <dynadiag/model/KnowledgeBase.hpp>

// Analysis
#include <dynadiag/analysis/ContactAnalyzer.hpp>
#include <dynadiag/analysis/CoverageAnalyzer.hpp>
#include <dynadiag/analysis/EnergyAnalyzer.hpp>
#include <dynadiag/analysis/FailureTracer.hpp>
#include <dynadiag/analysis/InstabilityAnalyzer.hpp>
#include <dynadiag/analysis/PerformanceAnalyzer.hpp>
#include <dynadiag/analysis/ScalingProjector.hpp>
#include <dynadiag/analysis/TerminationAnalyzer.hpp>
#include <dynadiag/analysis/TimestepAnalyzer.hpp>
#include <dynadiag/analysis/WarningAnalyzer.hpp>

// Report
#include <dynadiag/report/Aggregator.hpp>
#include <dynadiag/report/Report.hpp>
#include <dynadiag/report/ReportJson.hpp>

// Pipeline
#include <dynadiag/pipeline/DiagnosisPipeline.hpp>
