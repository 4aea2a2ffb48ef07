/**
 * @file output.cpp
 * @brief Artifact formatting and atomic writes.
 */

#include "output.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace marginalia {

namespace {

/// Flush the file's data to disk so a rename never outlives its contents.
bool sync_file(const fs::path& path, std::string* error) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        *error = "cannot reopen " + path.string() + ": " + std::strerror(errno);
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    if (!ok) {
        *error = "fsync failed for " + path.string() + ": " + std::strerror(errno);
    }
    ::close(fd);
    return ok;
}

}  // anonymous namespace


std::string dump_json(const nlohmann::ordered_json& j, JsonStyle style) {
    // Invalid UTF-8 in source comments is replaced rather than thrown on.
    if (style == JsonStyle::Pretty) {
        return j.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
    }
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

Destination route(const std::string& value, const std::string& default_path) {
    Destination dest;
    if (value == "stdout") {
        dest.to_stdout = true;
    } else if (value.empty()) {
        dest.path = default_path;
    } else {
        dest.path = value;
    }
    return dest;
}

bool write_text_atomic(const std::string& path, const std::string& text, std::string* error) {
    fs::path final_path(path);
    std::error_code ec;

    if (final_path.has_parent_path() && !fs::exists(final_path.parent_path(), ec)) {
        fs::create_directories(final_path.parent_path(), ec);
        if (ec) {
            *error = "cannot create directory " + final_path.parent_path().string() +
                     ": " + ec.message();
            return false;
        }
    }

    // .<name>.<pid>.tmp beside the target so the rename stays on one filesystem
    fs::path temp_path = final_path.parent_path() /
        ("." + final_path.filename().string() + "." + std::to_string(::getpid()) + ".tmp");

    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            *error = "cannot open temporary file " + temp_path.string();
            return false;
        }
        ofs << text;
        ofs.flush();
        if (ofs.fail()) {
            *error = "write failed: " + temp_path.string();
            ofs.close();
            fs::remove(temp_path, ec);
            return false;
        }
    }

    if (!sync_file(temp_path, error)) {
        fs::remove(temp_path, ec);
        return false;
    }

    fs::rename(temp_path, final_path, ec);
    if (ec) {
        *error = "cannot rename " + temp_path.string() + " to " + path + ": " + ec.message();
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return false;
    }
    return true;
}

bool emit_json(const nlohmann::ordered_json& j,
               const Destination& dest,
               JsonStyle style,
               std::ostream& out,
               EventLog* events) {
    const std::string text = dump_json(j, style);

    if (dest.to_stdout) {
        out << text;
        if (style == JsonStyle::Compact) {
            out << '\n';
        }
        out.flush();
        return true;
    }

    std::string error;
    if (!write_text_atomic(dest.path, text, &error)) {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["path"] = dest.path;
        events->append(event_kind::kWriteFailed, error, std::move(data));
        return false;
    }
    return true;
}

}  // namespace marginalia
