#pragma once
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace app_retrieval {
namespace fs = std::filesystem;

// Whole-file persistence. Writers never leave a half-written target behind:
// content lands in a sibling temp file which is then renamed over the target.
class AtomicFile {
public:
    static void write(const std::string& filePath, const std::string& content) {
        fs::path p(filePath);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());

        fs::path tmpPath = p.string() + ".tmp";
        {
            std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
            if (!out) throw std::runtime_error("Cannot open " + tmpPath.string() + " for writing");
            out << content;
            out.flush();
            if (!out) throw std::runtime_error("Failed writing " + tmpPath.string());
        }

        std::error_code ec;
        fs::rename(tmpPath, p, ec);
        if (ec) {
            std::string reason = ec.message();
            fs::remove(tmpPath, ec);
            throw std::runtime_error("Failed to replace " + p.string() + ": " + reason);
        }
    }

    // nullopt when the file does not exist or cannot be opened.
    static std::optional<std::string> read(const std::string& filePath) {
        std::ifstream in(filePath, std::ios::binary);
        if (!in) return std::nullopt;
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    static void append_line(const std::string& filePath, const std::string& line) {
        fs::path p(filePath);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::app);
        if (!out) throw std::runtime_error("Cannot open " + p.string() + " for append");
        out << line << '\n';
    }

    static void touch(const std::string& filePath) {
        fs::path p(filePath);
        if (fs::exists(p)) return;
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::app);
        if (!out) throw std::runtime_error("Cannot create " + p.string());
    }
};

} // namespace app_retrieval
