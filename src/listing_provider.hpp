#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class RcloneClient;

enum class EntryKind { File, Directory };

struct Entry {
  std::string name;
  EntryKind kind = EntryKind::File;
  std::string path;   // fully qualified for the backend that listed it

  bool is_directory() const { return kind == EntryKind::Directory; }
};

// Where a listing comes from: the local filesystem or a named rclone remote.
struct Backend {
  enum class Kind { Local, Remote };

  Kind kind = Kind::Local;
  std::string remote;

  static Backend local() { return Backend{}; }
  static Backend remote_named(std::string name) {
    Backend backend;
    backend.kind = Kind::Remote;
    backend.remote = std::move(name);
    return backend;
  }

  bool is_remote() const { return kind == Kind::Remote; }
  std::string display_name() const { return is_remote() ? remote : std::string("local"); }
};

class ListingError : public std::runtime_error {
public:
  enum class Reason { NotFound, PermissionDenied, BackendUnavailable };

  ListingError(Reason reason, std::string path, const std::string& detail);

  Reason reason() const { return reason_; }
  const std::string& path() const { return path_; }

private:
  Reason reason_;
  std::string path_;
};

const char* to_string(ListingError::Reason reason);

class ListingProvider {
public:
  virtual ~ListingProvider() = default;

  virtual const Backend& backend() const = 0;

  // Children of path, sorted by name. Throws ListingError.
  virtual std::vector<Entry> list(const std::string& path) = 0;

  virtual bool is_root(const std::string& path) const = 0;
  virtual std::string parent(const std::string& path) const = 0;
};

class LocalListingProvider : public ListingProvider {
public:
  explicit LocalListingProvider(bool show_hidden = false);

  const Backend& backend() const override { return backend_; }
  std::vector<Entry> list(const std::string& path) override;
  bool is_root(const std::string& path) const override;
  std::string parent(const std::string& path) const override;

  // Lexically normalised form without a trailing separator; navigation
  // starts from this so that parent() round trips compare equal.
  static std::string normalize(const std::string& path);

private:
  Backend backend_;
  bool show_hidden_;
};

// Remote paths look like "name:" for the root and "name:dir/sub/" below it.
class RemoteListingProvider : public ListingProvider {
public:
  RemoteListingProvider(std::shared_ptr<RcloneClient> rclone, std::string remote);

  const Backend& backend() const override { return backend_; }
  std::vector<Entry> list(const std::string& path) override;
  bool is_root(const std::string& path) const override;
  std::string parent(const std::string& path) const override;

  std::string root() const { return backend_.remote + ":"; }

private:
  std::shared_ptr<RcloneClient> rclone_;
  Backend backend_;
};
