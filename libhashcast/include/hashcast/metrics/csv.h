#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hashcast::metrics {

    // In-memory CSV builder for run events and sweep tables.
    // Every data row is prefixed with schema_version,run_uuid; the last row is
    // a "# summary" footer.
    //
    //   CsvWriter w(schema_version);
    //   w.set_run_uuid(util::uuid_v4());
    //   w.set_header(run_event_header());
    //   w.add_row({"12","demo","generated","packets","19"});
    //   w.finish_with_summary("recovered");
    class CsvWriter {
    public:
        explicit CsvWriter(int schema_version) : schema_version_(schema_version) {}

        void set_run_uuid(std::string uuid) { run_uuid_ = std::move(uuid); }

        // Column names for data rows (without the implicit prefix). Throws std::logic_error if set twice.
        void set_header(std::vector<std::string> columns);

        // Throws std::logic_error before set_header, std::invalid_argument on a column count mismatch.
        void add_row(const std::vector<std::string>& fields);

        // Appends the footer once; later rows are rejected.
        void finish_with_summary(std::string summary_text);

        const std::string& str() const noexcept { return buf_; }
        const std::vector<std::string>& header() const noexcept { return header_; }
        std::size_t row_count() const noexcept { return rows_; }
        bool finished() const noexcept { return finished_; }
        int schema_version() const noexcept { return schema_version_; }
        const std::string& run_uuid() const noexcept { return run_uuid_; }

        // Creates parent directories as needed and overwrites the file. Returns true on success.
        bool save_to_file(const std::filesystem::path& filepath) const;

    private:
        static void append_field(std::string& out, std::string_view field);
        void append_row(std::string_view first, std::string_view second, const std::vector<std::string>& rest);

        int schema_version_{ 1 };
        std::string run_uuid_;
        std::vector<std::string> header_;
        std::string buf_;
        std::size_t rows_{ 0 };
        bool finished_{ false };
    };

} // namespace hashcast::metrics
