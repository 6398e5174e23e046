// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKESCAN_SRC_REPORT_REPORT_WRITER_H_
#define STAKESCAN_SRC_REPORT_REPORT_WRITER_H_

#include "scanner/aggregator.hpp"
#include "util/common/logging.hpp"

#include <json/json.h>
#include <optional>
#include <string>

namespace stakescan::report {
    /// Number of finality providers listed in the log summary.
    static constexpr size_t summary_top_providers = 10;

    /// Converts a report into a JSON document. Object keys are ordered by
    /// name so equal reports always give identical documents.
    /// \param report report to convert.
    /// \return JSON document.
    auto to_json(const scanner::scan_report& report) -> Json::Value;

    /// Serializes a report into an indented JSON string.
    /// \param report report to serialize.
    /// \return JSON text, newline terminated.
    auto serialize(const scanner::scan_report& report) -> std::string;

    /// Writes a report to a file, replacing any existing content, or to
    /// stdout if the path is "-".
    /// \param report report to write.
    /// \param path destination path.
    /// \return std::nullopt on success, an error message otherwise.
    auto write_report(const scanner::scan_report& report,
                      const std::string& path) -> std::optional<std::string>;

    /// Logs a human-readable summary of a report at info level, including
    /// the finality providers with the largest delegated amounts.
    /// \param report report to summarize.
    /// \param log log instance.
    void log_summary(const scanner::scan_report& report, logging::log& log);
}

#endif // STAKESCAN_SRC_REPORT_REPORT_WRITER_H_
