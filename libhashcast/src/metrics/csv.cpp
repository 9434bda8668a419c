#include <hashcast/metrics/csv.h>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace hashcast::metrics {

    namespace {

        bool needs_quotes(std::string_view s) {
            return s.find_first_of(",\"\r\n") != std::string_view::npos;
        }

    } // namespace

    void CsvWriter::append_field(std::string& out, std::string_view field) {
        if (!needs_quotes(field)) {
            out.append(field);
            return;
        }
        out.push_back('"');
        for (char c : field) {
            if (c == '"') out.push_back('"');
            out.push_back(c);
        }
        out.push_back('"');
    }

    void CsvWriter::append_row(std::string_view first, std::string_view second, const std::vector<std::string>& rest) {
        append_field(buf_, first);
        buf_.push_back(',');
        append_field(buf_, second);
        for (const auto& f : rest) {
            buf_.push_back(',');
            append_field(buf_, f);
        }
        buf_.push_back('\n');
    }

    void CsvWriter::set_header(std::vector<std::string> columns) {
        if (!header_.empty()) {
            throw std::logic_error("CsvWriter: header already set");
        }
        header_ = std::move(columns);
        append_row("schema_version", "run_uuid", header_);
    }

    void CsvWriter::add_row(const std::vector<std::string>& fields) {
        if (header_.empty()) {
            throw std::logic_error("CsvWriter: set_header must be called before add_row");
        }
        if (finished_) {
            throw std::logic_error("CsvWriter: summary already written");
        }
        if (fields.size() != header_.size()) {
            throw std::invalid_argument("CsvWriter: field count does not match header");
        }
        append_row(std::to_string(schema_version_), run_uuid_, fields);
        ++rows_;
    }

    void CsvWriter::finish_with_summary(std::string summary_text) {
        if (finished_) return;
        append_row("# summary", std::to_string(schema_version_), { run_uuid_, std::move(summary_text) });
        finished_ = true;
    }

    bool CsvWriter::save_to_file(const std::filesystem::path& filepath) const {
        if (filepath.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(filepath.parent_path(), ec);
            if (ec) return false;
        }
        std::ofstream os(filepath, std::ios::binary | std::ios::trunc);
        if (!os) return false;
        os.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        return static_cast<bool>(os);
    }

} // namespace hashcast::metrics
