#include "listing_provider.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "process_runner.hpp"
#include "rclone_client.hpp"

namespace fs = std::filesystem;

namespace {

bool by_name(const Entry& a, const Entry& b) {
  return a.name < b.name;
}

ListingError::Reason reason_for(const std::error_code& ec) {
  if(ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    return ListingError::Reason::NotFound;
  }
  if(ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return ListingError::Reason::PermissionDenied;
  }
  return ListingError::Reason::BackendUnavailable;
}

} // namespace

ListingError::ListingError(Reason reason, std::string path, const std::string& detail)
  : std::runtime_error(std::string(to_string(reason)) + ": " + path +
                       (detail.empty() ? std::string() : " (" + detail + ")")),
    reason_(reason),
    path_(std::move(path)) {}

const char* to_string(ListingError::Reason reason) {
  switch(reason) {
    case ListingError::Reason::NotFound: return "not found";
    case ListingError::Reason::PermissionDenied: return "permission denied";
    case ListingError::Reason::BackendUnavailable: return "backend unavailable";
  }
  return "unknown";
}

// ---- local ----

LocalListingProvider::LocalListingProvider(bool show_hidden)
  : backend_(Backend::local()), show_hidden_(show_hidden) {}

std::string LocalListingProvider::normalize(const std::string& path) {
  if(path.empty()) return ".";
  fs::path p = fs::path(path).lexically_normal();
  std::string out = p.string();
  while(out.size() > 1 && out.back() == '/') out.pop_back();
  return out.empty() ? std::string(".") : out;
}

std::vector<Entry> LocalListingProvider::list(const std::string& path) {
  std::error_code ec;
  if(!fs::is_directory(path, ec)) {
    if(!ec) ec = std::make_error_code(std::errc::not_a_directory);
    throw ListingError(reason_for(ec), path, ec.message());
  }

  fs::directory_iterator it(path, ec);
  if(ec) throw ListingError(reason_for(ec), path, ec.message());

  std::vector<Entry> entries;
  for(const fs::directory_iterator end; it != end; it.increment(ec)) {
    if(ec) throw ListingError(reason_for(ec), path, ec.message());
    std::string name = it->path().filename().string();
    if(!show_hidden_ && !name.empty() && name.front() == '.') continue;

    std::error_code type_ec;
    Entry entry;
    entry.name = name;
    entry.kind = it->is_directory(type_ec) ? EntryKind::Directory : EntryKind::File;
    entry.path = (fs::path(path) / name).string();
    entries.push_back(std::move(entry));
  }
  if(ec) throw ListingError(reason_for(ec), path, ec.message());

  std::sort(entries.begin(), entries.end(), by_name);
  return entries;
}

bool LocalListingProvider::is_root(const std::string& path) const {
  fs::path p(normalize(path));
  return p.has_root_path() && p == p.root_path();
}

std::string LocalListingProvider::parent(const std::string& path) const {
  fs::path p(normalize(path));
  if(p.has_root_path() && p == p.root_path()) return p.string();
  if(!p.has_parent_path()) {
    // relative single component such as "docs" or "."
    return normalize((fs::path(p) / "..").string());
  }
  return p.parent_path().string();
}

// ---- remote ----

RemoteListingProvider::RemoteListingProvider(std::shared_ptr<RcloneClient> rclone, std::string remote)
  : rclone_(std::move(rclone)) {
  if(!remote.empty() && remote.back() == ':') remote.pop_back();
  backend_ = Backend::remote_named(std::move(remote));
}

std::vector<Entry> RemoteListingProvider::list(const std::string& path) {
  std::vector<std::string> lines;
  try {
    lines = rclone_->list_path(path);
  } catch(const CommandError& e) {
    // rclone reports a missing directory with exit code 3 (or 4 for a file)
    const auto reason = (e.exit_code() == 3 || e.exit_code() == 4)
                          ? ListingError::Reason::NotFound
                          : ListingError::Reason::BackendUnavailable;
    throw ListingError(reason, path, e.what());
  }

  std::string prefix = path;
  if(prefix.empty()) prefix = root();
  if(prefix.back() != ':' && prefix.back() != '/') prefix += '/';

  std::vector<Entry> entries;
  for(const auto& line : lines) {
    Entry entry;
    if(line.back() == '/') {
      entry.kind = EntryKind::Directory;
      entry.name = line.substr(0, line.size() - 1);
      entry.path = prefix + line;
    } else {
      entry.kind = EntryKind::File;
      entry.name = line;
      entry.path = prefix + line;
    }
    if(entry.name.empty()) continue;
    entries.push_back(std::move(entry));
  }
  std::sort(entries.begin(), entries.end(), by_name);
  return entries;
}

bool RemoteListingProvider::is_root(const std::string& path) const {
  return path.empty() || path == root() || path == backend_.remote;
}

std::string RemoteListingProvider::parent(const std::string& path) const {
  if(is_root(path)) return root();
  auto colon = path.find(':');
  if(colon == std::string::npos) return root();

  std::string rest = path.substr(colon + 1);
  while(!rest.empty() && rest.back() == '/') rest.pop_back();
  auto slash = rest.rfind('/');
  if(slash == std::string::npos) return root();
  return path.substr(0, colon + 1) + rest.substr(0, slash + 1);
}
