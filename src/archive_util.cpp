#include "archive_util.h"

#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace kiln {
namespace {

struct zip_writer : unmovable {
  zip_writer() : handle(archive_write_new()) {
    if (!handle) { throw std::runtime_error("archive_write_new failed"); }
    if (archive_write_set_format_zip(handle) != ARCHIVE_OK) {
      std::string const message{ archive_error_string(handle) };
      archive_write_free(handle);
      handle = nullptr;
      throw std::runtime_error("archive_write_set_format_zip failed: " + message);
    }
  }

  ~zip_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct entry_ptr : unmovable {
  entry_ptr() : handle(archive_entry_new()) {
    if (!handle) { throw std::runtime_error("archive_entry_new failed"); }
  }
  ~entry_ptr() { archive_entry_free(handle); }

  archive_entry *handle{ nullptr };
};

struct tree_entry {
  std::string relative;
  std::filesystem::path absolute;
  bool is_directory;
};

std::vector<tree_entry> collect_sorted(std::filesystem::path const &directory) {
  std::vector<tree_entry> entries;
  std::error_code ec;
  for (std::filesystem::recursive_directory_iterator it{ directory, ec }, end; it != end;
       it.increment(ec)) {
    if (ec) { break; }
    bool const is_dir{ it->is_directory() };
    if (!is_dir && !it->is_regular_file()) { continue; }
    entries.push_back(tree_entry{
        .relative = std::filesystem::relative(it->path(), directory).generic_string(),
        .absolute = it->path(),
        .is_directory = is_dir,
    });
  }
  if (ec) {
    throw std::runtime_error("archive_zip_directory: failed to walk " + directory.string() +
                             ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end(), [](tree_entry const &a, tree_entry const &b) {
    return a.relative < b.relative;
  });
  return entries;
}

}  // namespace

std::uint64_t archive_zip_directory(std::filesystem::path const &directory,
                                    std::filesystem::path const &zip_path) {
  if (!std::filesystem::is_directory(directory)) {
    throw std::runtime_error("archive_zip_directory: not a directory: " +
                             directory.string());
  }

  auto const entries{ collect_sorted(directory) };

  if (auto const parent{ zip_path.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("archive_zip_directory: failed to create " + parent.string() +
                               ": " + ec.message());
    }
  }

  zip_writer writer;
  if (archive_write_open_filename(writer.handle, zip_path.string().c_str()) != ARCHIVE_OK) {
    throw std::runtime_error(std::string("Failed to open archive for writing: ") +
                             archive_error_string(writer.handle));
  }

  std::uint64_t files_written{ 0 };

  for (auto const &item : entries) {
    entry_ptr entry;
    std::string const pathname{ item.is_directory ? item.relative + "/" : item.relative };
    archive_entry_set_pathname(entry.handle, pathname.c_str());
    archive_entry_set_mtime(entry.handle, 0, 0);

    std::vector<unsigned char> content;
    if (item.is_directory) {
      archive_entry_set_filetype(entry.handle, AE_IFDIR);
      archive_entry_set_perm(entry.handle, 0755);
      archive_entry_set_size(entry.handle, 0);
    } else {
      content = util_load_file(item.absolute);
      auto const perms{ std::filesystem::status(item.absolute).permissions() };
      bool const executable{ (perms & std::filesystem::perms::owner_exec) !=
                             std::filesystem::perms::none };
      archive_entry_set_filetype(entry.handle, AE_IFREG);
      archive_entry_set_perm(entry.handle, executable ? 0755 : 0644);
      archive_entry_set_size(entry.handle, static_cast<la_int64_t>(content.size()));
    }

    if (archive_write_header(writer.handle, entry.handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to write entry header: ") +
                               archive_error_string(writer.handle));
    }

    if (!content.empty()) {
      la_ssize_t const written{
        archive_write_data(writer.handle, content.data(), content.size())
      };
      if (written < 0 || static_cast<std::size_t>(written) != content.size()) {
        throw std::runtime_error(std::string("Failed to write entry data: ") +
                                 archive_error_string(writer.handle));
      }
    }

    if (!item.is_directory) { ++files_written; }
  }

  if (archive_write_close(writer.handle) != ARCHIVE_OK) {
    throw std::runtime_error(std::string("Failed to finish archive: ") +
                             archive_error_string(writer.handle));
  }

  return files_written;
}

}  // namespace kiln
