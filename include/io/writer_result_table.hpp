#ifndef CLIMEXTRACT_WRITER_RESULT_TABLE_HPP
#define CLIMEXTRACT_WRITER_RESULT_TABLE_HPP

#include <string>
#include <gdal.h>
#include "extract/common.hpp"

namespace climextract {
namespace io {

/**
 * Configuration for result table output writer
 */
struct ResultTableWriterConfig {
    std::string output_file_path;   // Output CSV path; the parent directory is created if absent

    ResultTableWriterConfig() = default;
};

/**
 * Result table writer using the GDAL CSV driver.
 * Every column is written as text; empty cells are left unset (null).
 */
class ResultTableWriter {
public:
    ResultTableWriter();
    ~ResultTableWriter() = default;

    // Disable copy constructor and assignment
    ResultTableWriter(const ResultTableWriter&) = delete;
    ResultTableWriter& operator=(const ResultTableWriter&) = delete;

    /**
     * Write the table, replacing an existing file of the same name
     * @param config Writer configuration
     * @param table Header and rows
     * @return true if successful, false otherwise
     */
    bool writeResultTable(const ResultTableWriterConfig& config, const extract::ResultTable& table);

    /**
     * Get the last error message
     * @return Error message string
     */
    std::string getLastError() const { return last_error_; }

private:
    std::string last_error_;  // Last error message

    /**
     * Create the CSV dataset and its attribute-only layer with one field per header column
     * @return Dataset handle, or nullptr on failure
     */
    GDALDatasetH createDataset(const std::string& output_file_path, const extract::ResultTable& table);
};

} // namespace io
} // namespace climextract

#endif // CLIMEXTRACT_WRITER_RESULT_TABLE_HPP
