#include "cookie_storage.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../../utils/time_utils.hpp"

namespace cookies {
    namespace {
        constexpr const char* FILE_HEADER = "# wave cookie jar v1";
        constexpr size_t FIELD_COUNT = 9;

        bool as_flag(const std::string& s) { return s == "1"; }

        const char* flag(bool b) { return b ? "1" : "0"; }

        // Backslash escapes keep tabs and line breaks inside a field from splitting the record.
        std::string escape_field(const std::string& raw) {
            std::string out;
            out.reserve(raw.size());
            for (const char ch : raw) {
                switch (ch) {
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    default:
                        out += ch;
                }
            }
            return out;
        }

        std::string unescape_field(const std::string& escaped) {
            std::string out;
            out.reserve(escaped.size());
            for (size_t i = 0; i < escaped.size(); ++i) {
                if (escaped[i] != '\\' || i + 1 == escaped.size()) {
                    out += escaped[i];
                    continue;
                }
                switch (escaped[++i]) {
                    case 't':
                        out += '\t';
                        break;
                    case 'n':
                        out += '\n';
                        break;
                    case 'r':
                        out += '\r';
                        break;
                    default:
                        out += escaped[i];
                }
            }
            return out;
        }
    }  // namespace

    FileCookieStorage::FileCookieStorage(std::filesystem::path path) : path_(std::move(path)) {}

    std::vector<Cookie> FileCookieStorage::load() {
        std::vector<Cookie> out;

        if (!std::filesystem::exists(path_)) {
            return out;
        }

        std::ifstream in(path_);
        if (!in) {
            throw std::runtime_error("open failed: " + path_.string());
        }

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty() || line.front() == '#') {
                continue;
            }

            const auto fields = string_utils::split(line, '\t');
            if (fields.size() != FIELD_COUNT) {
                spdlog::warn("Skipping malformed cookie line {} in {}", line_no, path_.string());
                continue;
            }

            Cookie c{
                .id_ = unescape_field(fields[8]),
                .domain_ = unescape_field(fields[0]),
                .path_ = unescape_field(fields[1]),
                .name_ = unescape_field(fields[2]),
                .value_ = unescape_field(fields[3]),
                .secure_ = as_flag(fields[5]),
                .http_only_ = as_flag(fields[6]),
                .enabled_ = as_flag(fields[7]),
            };

            char* end = nullptr;
            const long long expires = std::strtoll(fields[4].c_str(), &end, constants::BASE_10);
            if (expires > 0) {
                c.expires_ = time_utils::from_unix_seconds(expires);
            }

            out.push_back(std::move(c));
        }

        return out;
    }

    void FileCookieStorage::save(const std::vector<Cookie>& cookies) {
        std::ostringstream oss;
        oss << FILE_HEADER << '\n';
        for (const auto& c : cookies) {
            const long long expires = c.expires_ ? time_utils::to_unix_seconds(*c.expires_) : 0;
            oss << escape_field(c.domain_) << '\t' << escape_field(c.path_) << '\t' << escape_field(c.name_) << '\t' << escape_field(c.value_) << '\t'
                << expires << '\t' << flag(c.secure_) << '\t' << flag(c.http_only_) << '\t' << flag(c.enabled_) << '\t' << escape_field(c.id_) << '\n';
        }

        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }
        write_atomic(path_, oss.str());
    }

    void FileCookieStorage::write_atomic(const std::filesystem::path& p, std::string_view bytes) {
        auto tmp = p;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }
        std::filesystem::rename(tmp, p);  // atomic on same filesystem
    }
}  // namespace cookies
