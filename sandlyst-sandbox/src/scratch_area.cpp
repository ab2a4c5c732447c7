#include "scratch_area.hpp"
#include "sandbox_errors.hpp"
#include <fstream>
#include <vector>
#include <cerrno>
#include <cstring>
#include <cstdlib>

namespace fs = std::filesystem;

namespace sandlyst {

bool is_path_within(const fs::path& base, const fs::path& candidate) {
    fs::path norm_base = base.lexically_normal();
    fs::path norm_candidate = (candidate.is_absolute() ? candidate : base / candidate).lexically_normal();

    fs::path rel = norm_candidate.lexically_relative(norm_base);
    if (rel.empty() || rel == ".") {
        return false;
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

ScratchArea::ScratchArea(const std::string& parent)
    : removed_(false)
{
    std::error_code ec;
    fs::path parent_path = parent.empty() ? fs::temp_directory_path(ec) : fs::path(parent);
    if (ec) {
        throw ScratchAreaError("no temporary directory: " + ec.message());
    }
    fs::create_directories(parent_path, ec);
    if (ec) {
        throw ScratchAreaError("cannot create " + parent_path.string() + ": " + ec.message());
    }

    std::string pattern = (parent_path / "sandlyst_XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw ScratchAreaError("mkdtemp failed under " + parent_path.string() + ": " + std::strerror(errno));
    }
    root_ = fs::path(buf.data());

    try {
        fs::create_directory(in_dir());
        fs::create_directory(out_dir());
        fs::create_directory(data_dir());

        // The container user differs from the host user; it must be able to
        // traverse the tree and write into out/
        fs::permissions(root_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                               fs::perms::others_read | fs::perms::others_exec);
        fs::permissions(out_dir(), fs::perms::all);
    } catch (const fs::filesystem_error& e) {
        remove();
        throw ScratchAreaError(e.what());
    }
}

ScratchArea::~ScratchArea() {
    remove();
}

fs::path ScratchArea::write_script(const std::string& filename, const std::string& content) {
    fs::path target = in_dir() / filename;
    if (!is_path_within(in_dir(), target)) {
        throw ScratchAreaError("script name escapes the input area: " + filename);
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ScratchAreaError("cannot write " + target.string());
    }
    out << content;
    out.close();
    if (!out) {
        throw ScratchAreaError("failed writing " + target.string());
    }

    std::error_code ec;
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read, ec);
    return target;
}

bool ScratchArea::stage_input(const std::string& name, const std::string& source_path, std::string& error) {
    fs::path name_path(name);
    if (name.empty() || name_path.is_absolute() || name_path.has_parent_path() ||
        !is_path_within(data_dir(), data_dir() / name_path)) {
        error = "input name escapes the data area: " + name;
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(source_path, ec)) {
        error = "input file not found: " + source_path;
        return false;
    }

    fs::path target = data_dir() / name_path;
    fs::copy_file(source_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "cannot copy " + source_path + ": " + ec.message();
        return false;
    }
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read, ec);
    return true;
}

void ScratchArea::remove() noexcept {
    if (removed_ || root_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(root_, ec);
    // Files created by the container user may need their parent made writable first
    if (ec && fs::exists(root_, ec)) {
        for (auto it = fs::recursive_directory_iterator(root_, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code perm_ec;
            if (it->is_directory(perm_ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
            }
        }
        fs::remove_all(root_, ec);
    }
    removed_ = true;
}

} // namespace sandlyst
