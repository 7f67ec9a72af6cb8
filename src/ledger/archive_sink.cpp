#include "auditchain/ledger/archive_sink.h"

#include "auditchain/core/sha256.h"
#include "auditchain/domain/record_json.h"

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <system_error>

namespace auditchain::ledger {

namespace {

// File-name-safe rendering of a scope.
std::string scope_slug(const domain::ChainScope& scope) {
  if (scope.is_global()) {
    return "global";
  }
  std::string slug = "ws-";
  for (const char c : scope.workspace_id.value()) {
    const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                      c == '-' || c == '_';
    slug.push_back(safe ? c : '_');
  }
  return slug;
}

// 2026-01-02T03:04:05.678Z -> 20260102T030405678Z
std::string compact_timestamp(core::Timestamp ts) {
  std::string out;
  for (const char c : core::format_iso8601_millis(ts)) {
    if (c != '-' && c != ':' && c != '.') {
      out.push_back(c);
    }
  }
  return out;
}

// fsync on a file or directory; false if it could not be opened or synced.
bool sync_to_disk(const std::filesystem::path& path, int open_flags) {
  const int fd = ::open(path.c_str(), open_flags);
  if (fd < 0) {
    return false;
  }
  const bool synced = ::fsync(fd) == 0;
  const bool closed = ::close(fd) == 0;
  return synced && closed;
}

}  // namespace

JsonlFileArchiveSink::JsonlFileArchiveSink(std::filesystem::path directory, core::IClock& clock)
    : directory_(std::move(directory)), clock_(clock) {}

core::Result<ArchiveReceipt, std::string> JsonlFileArchiveSink::store(
    const domain::ChainScope& scope, const std::vector<domain::AuditRecord>& records) {
  using R = core::Result<ArchiveReceipt, std::string>;

  if (records.empty()) {
    return R::err("nothing to archive");
  }

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    return R::err("cannot create archive directory " + directory_.string() + ": " + ec.message());
  }

  const std::filesystem::path path =
      directory_ / ("audit-" + scope_slug(scope) + "-" + compact_timestamp(clock_.now()) + "-" +
                    records.back().id + ".jsonl");

  // The file only appears under its final name once its content is durable.
  std::filesystem::path partial = path;
  partial += ".partial";

  core::Sha256 hasher;
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      return R::err("cannot open archive file " + partial.string());
    }
    for (const auto& record : records) {
      const std::string line = domain::audit_record_to_json(record).dump() + "\n";
      out.write(line.data(), static_cast<std::streamsize>(line.size()));
      hasher.update(line);
    }
    out.close();
    if (!out) {
      std::filesystem::remove(partial, ec);
      return R::err("failed writing archive file " + partial.string());
    }
  }

  if (!sync_to_disk(partial, O_RDONLY)) {
    std::filesystem::remove(partial, ec);
    return R::err("cannot fsync archive file " + partial.string());
  }

  std::filesystem::rename(partial, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(partial, ec);
    return R::err("cannot move archive file into place at " + path.string() + ": " + reason);
  }

  if (!sync_to_disk(directory_, O_RDONLY | O_DIRECTORY)) {
    return R::err("cannot fsync archive directory " + directory_.string());
  }

  return R::ok(ArchiveReceipt{path.string(), hasher.finalize_hex()});
}

}  // namespace auditchain::ledger
