#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/dir/sample_file_dir.hpp"
#include "internal/meta/identity_guard.hpp"
#include "internal/meta/open_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "sampledir/v1.hpp"

using sampledir::dir::SampleFileDir;
using sampledir::v1::DirMeta;

namespace {

constexpr int kExitUsage    = 1;
constexpr int kExitError    = 2;
constexpr int kExitMismatch = 3;

void Usage() {
  std::cout << "Usage:\n"
            << "  sampledirctl [--config <yaml>] init <dir> <db_uuid> [dir_uuid]\n"
            << "  sampledirctl [--config <yaml>] show <dir>\n"
            << "  sampledirctl [--config <yaml>] check <dir> <db_uuid> <dir_uuid>\n"
            << "  sampledirctl [--config <yaml>] open <dir> <db_uuid> <dir_uuid> <open_id>\n"
            << "  sampledirctl [--config <yaml>] complete <dir> <db_uuid> <dir_uuid>\n"
            << "  sampledirctl [--config <yaml>] delete <dir> <db_uuid> <dir_uuid>\n";
}

std::string UuidArg(const std::string& s) {
  return sampledir::util::ToBytes(sampledir::util::FromString(s));
}

DirMeta Identity(const std::string& db_uuid, const std::string& dir_uuid) {
  DirMeta meta;
  meta.set_db_uuid(UuidArg(db_uuid));
  meta.set_dir_uuid(UuidArg(dir_uuid));
  return meta;
}

// The database's view of the directory's opens is not available to this tool,
// so lifecycle commands take the sidecar's own history as the expectation and
// verify identity only.
DirMeta ExpectedFromSidecar(const std::string& path, const std::string& meta_file_name, const DirMeta& identity) {
  DirMeta expected = identity;
  auto    current  = SampleFileDir::ReadMeta(path, meta_file_name);
  if (current.has_value() && current->has_last_complete_open()) {
    *expected.mutable_last_complete_open() = current->last_complete_open();
  }
  return expected;
}

void PrintOpen(const char* label, bool present, const DirMeta::Open& open) {
  std::cout << label << ": ";
  if (!present) {
    std::cout << "<none>\n";
    return;
  }
  std::cout << "id=" << open.id() << " uuid=" << sampledir::util::FormatBytes(open.uuid()) << "\n";
}

void PrintMeta(const DirMeta& meta) {
  std::cout << "db_uuid: " << sampledir::util::FormatBytes(meta.db_uuid()) << "\n"
            << "dir_uuid: " << sampledir::util::FormatBytes(meta.dir_uuid()) << "\n";
  PrintOpen("last_complete_open", meta.has_last_complete_open(), meta.last_complete_open());
  PrintOpen("in_progress_open", meta.has_in_progress_open(), meta.in_progress_open());
  std::cout << "state: " << sampledir::meta::ToString(sampledir::meta::DeriveState(meta)) << "\n";
}

int Run(const std::vector<std::string>& args, const std::string& meta_file_name) {
  const auto& cmd = args[0];

  if (cmd == "init") {
    if (args.size() < 3 || args.size() > 4) return kExitUsage;
    const auto dir_uuid =
        args.size() == 4 ? args[3] : sampledir::util::ToString(sampledir::util::GenerateUUID());
    SampleFileDir::Create(args[1], Identity(args[2], dir_uuid), meta_file_name);
    std::cout << dir_uuid << "\n";
    return 0;
  }

  if (cmd == "show") {
    if (args.size() != 2) return kExitUsage;
    auto meta = SampleFileDir::ReadMeta(args[1], meta_file_name);
    if (!meta.has_value()) {
      std::cerr << "no meta file in " << args[1] << "\n";
      return kExitError;
    }
    PrintMeta(*meta);
    return 0;
  }

  if (cmd == "check") {
    if (args.size() != 4) return kExitUsage;
    auto meta     = SampleFileDir::ReadMeta(args[1], meta_file_name).value_or(DirMeta{});
    auto expected = Identity(args[2], args[3]);
    auto result   = sampledir::meta::Check(meta, expected.db_uuid(), expected.dir_uuid());
    if (!result) {
      std::cout << sampledir::util::ToString(result.kind) << ": " << result.message << "\n";
      return kExitMismatch;
    }
    std::cout << "consistent\n";
    return 0;
  }

  if (cmd == "open" || cmd == "complete" || cmd == "delete") {
    const std::size_t expected_args = cmd == "open" ? 5 : 4;
    if (args.size() != expected_args) return kExitUsage;

    auto expected = ExpectedFromSidecar(args[1], meta_file_name, Identity(args[2], args[3]));
    auto dir      = SampleFileDir::Open(args[1], expected, meta_file_name);

    if (cmd == "open") {
      const auto id = std::stoul(args[4]);
      if (id > UINT32_MAX) {
        throw std::invalid_argument("open id out of range: " + args[4]);
      }
      DirMeta::Open open;
      open.set_id(static_cast<uint32_t>(id));
      open.set_uuid(sampledir::util::ToBytes(sampledir::util::GenerateUUID()));
      dir.BeginOpen(open);
    } else if (cmd == "complete") {
      dir.CompleteOpen();
    } else {
      dir.Delete();
    }
    PrintMeta(dir.Tracker().Snapshot());
    return 0;
  }

  return kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return kExitUsage;
  }

  try {
    sampledir::runtime::config::RuntimeConfig config;
    if (config_path.has_value()) {
      config = sampledir::config::ConfigLoader::LoadFromYaml(*config_path);
    }
    sampledir::observability::InitializeLogging(config);

    const int rc = Run(args, sampledir::config::ConfigLoader::MetaFileName(config));
    if (rc == kExitUsage) {
      Usage();
    }
    sampledir::observability::ShutdownLogging();
    return rc;
  } catch (const sampledir::util::ConsistencyMismatch& e) {
    SAMPLEDIR_LOG_ERROR("Directory mismatch", {sampledir::observability::StringField("kind", sampledir::util::ToString(e.Kind())),
                                               sampledir::observability::StringField("error", e.what())});
    sampledir::observability::ShutdownLogging();
    return kExitMismatch;
  } catch (const std::exception& e) {
    SAMPLEDIR_LOG_ERROR("Fatal error", {sampledir::observability::StringField("error", e.what())});
    sampledir::observability::ShutdownLogging();
    return kExitError;
  }
}
