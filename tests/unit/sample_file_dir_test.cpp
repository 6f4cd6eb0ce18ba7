#include "internal/dir/sample_file_dir.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/meta/meta_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using sampledir::dir::SampleFileDir;
using sampledir::meta::OpenState;
using sampledir::util::ConsistencyMismatch;
using sampledir::util::InvalidState;
using sampledir::util::MismatchKind;
using sampledir::v1::DirMeta;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "sampledir_sample_file_dir_tests" / test_name;
  std::filesystem::remove_all(dir);
  return dir;
}

DirMeta MakeIdentity() {
  DirMeta meta;
  meta.set_db_uuid(sampledir::util::ToBytes(sampledir::util::GenerateUUID()));
  meta.set_dir_uuid(sampledir::util::ToBytes(sampledir::util::GenerateUUID()));
  return meta;
}

DirMeta::Open MakeOpen(uint32_t id) {
  DirMeta::Open open;
  open.set_id(id);
  open.set_uuid(sampledir::util::ToBytes(sampledir::util::GenerateUUID()));
  return open;
}

void WriteSampleFile(const std::filesystem::path& dir, const std::string& name) {
  std::ofstream out(dir / name, std::ios::binary);
  out << "recording";
}

MismatchKind OpenMismatch(const std::filesystem::path& path, const DirMeta& expected) {
  try {
    (void)SampleFileDir::Open(path, expected);
  } catch (const ConsistencyMismatch& e) {
    return e.Kind();
  }
  return MismatchKind::kNone;
}

void TestCreateWritesIdentityOnlyRecord() {
  const auto path     = FreshDir("create");
  const auto identity = MakeIdentity();

  auto dir = SampleFileDir::Create(path, identity);
  assert(dir.Tracker().State() == OpenState::kEmpty);
  assert(std::filesystem::file_size(path / "meta") == sampledir::meta::kMetaBlockSize);

  auto meta = SampleFileDir::ReadMeta(path);
  assert(meta.has_value());
  assert(meta->db_uuid() == identity.db_uuid());
  assert(meta->dir_uuid() == identity.dir_uuid());
  assert(!meta->has_last_complete_open());
  assert(!meta->has_in_progress_open());
}

void TestCreateRefusesNonEmptyDirectory() {
  const auto path = FreshDir("create_non_empty");
  std::filesystem::create_directories(path);
  WriteSampleFile(path, "0000000100000001");

  bool threw = false;
  try {
    (void)SampleFileDir::Create(path, MakeIdentity());
  } catch (const InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(path / "meta"));
}

void TestCreateRefusesForeignSidecar() {
  const auto path = FreshDir("create_foreign");
  (void)SampleFileDir::Create(path, MakeIdentity());

  bool threw = false;
  try {
    (void)SampleFileDir::Create(path, MakeIdentity());
  } catch (const ConsistencyMismatch& e) {
    threw = e.Kind() == MismatchKind::kDirectoryIdentity;
  }
  assert(threw);
}

void TestCreateRecoversFromUnreadableSidecar() {
  const auto path     = FreshDir("create_torn");
  const auto identity = MakeIdentity();
  std::filesystem::create_directories(path);

  // Left by a crash right after the sidecar was created.
  { std::ofstream out(path / "meta", std::ios::binary); }
  assert(!SampleFileDir::ReadMeta(path).has_value());
  assert(OpenMismatch(path, identity) == MismatchKind::kDirectoryIdentity);
  (void)SampleFileDir::Create(path, identity);
  assert(SampleFileDir::ReadMeta(path)->dir_uuid() == identity.dir_uuid());

  // Torn mid-write.
  {
    std::ofstream out(path / "meta", std::ios::binary | std::ios::trunc);
    out << std::string(sampledir::meta::kMetaBlockSize, static_cast<char>(0xFF));
  }
  auto dir = SampleFileDir::Create(path, identity);
  assert(dir.Tracker().State() == OpenState::kEmpty);
  assert(SampleFileDir::ReadMeta(path)->dir_uuid() == identity.dir_uuid());
  (void)SampleFileDir::Open(path, identity);
}

void TestCreateRefusesSidecarWithOpens() {
  const auto path     = FreshDir("create_with_opens");
  const auto identity = MakeIdentity();
  const auto open     = MakeOpen(1);
  {
    auto dir = SampleFileDir::Create(path, identity);
    dir.BeginOpen(open);
  }

  auto create_refused = [&] {
    try {
      (void)SampleFileDir::Create(path, identity);
    } catch (const InvalidState&) {
      return true;
    }
    return false;
  };

  assert(create_refused());
  assert(SampleFileDir::ReadMeta(path)->in_progress_open().id() == 1);

  {
    auto dir = SampleFileDir::Open(path, identity);
    dir.CompleteOpen();
  }
  assert(create_refused());
  auto meta = SampleFileDir::ReadMeta(path);
  assert(meta->last_complete_open().uuid() == open.uuid());
  assert(meta->in_progress_open().uuid() == open.uuid());
}

void TestLifecyclePersistsAcrossReopen() {
  const auto path     = FreshDir("reopen");
  const auto identity = MakeIdentity();
  (void)SampleFileDir::Create(path, identity);

  const auto open = MakeOpen(1);
  {
    auto dir = SampleFileDir::Open(path, identity);
    dir.BeginOpen(open);
  }

  // Process restarted before the open completed: db still has no completed open.
  {
    auto dir = SampleFileDir::Open(path, identity);
    assert(dir.Tracker().State() == OpenState::kOpening);
    dir.CompleteOpen();
  }

  auto expected = identity;
  *expected.mutable_last_complete_open() = open;
  auto dir = SampleFileDir::Open(path, expected);
  assert(dir.Tracker().State() == OpenState::kStable);
  assert(dir.Tracker().Snapshot().last_complete_open().uuid() == open.uuid());
}

void TestOpenDetectsMismatches() {
  const auto path     = FreshDir("mismatch");
  const auto identity = MakeIdentity();
  (void)SampleFileDir::Create(path, identity);

  auto other_dir = identity;
  other_dir.set_dir_uuid(sampledir::util::ToBytes(sampledir::util::GenerateUUID()));
  assert(OpenMismatch(path, other_dir) == MismatchKind::kDirectoryIdentity);

  auto other_db = identity;
  other_db.set_db_uuid(sampledir::util::ToBytes(sampledir::util::GenerateUUID()));
  assert(OpenMismatch(path, other_db) == MismatchKind::kDatabaseIdentity);

  auto ahead = identity;
  *ahead.mutable_last_complete_open() = MakeOpen(9);
  assert(OpenMismatch(path, ahead) == MismatchKind::kOpenLifecycle);

  // No sidecar at all.
  std::filesystem::remove(path / "meta");
  assert(OpenMismatch(path, identity) == MismatchKind::kDirectoryIdentity);
}

void TestOpenReportsCorruptSidecar() {
  const auto path     = FreshDir("corrupt");
  const auto identity = MakeIdentity();
  (void)SampleFileDir::Create(path, identity);
  {
    std::ofstream out(path / "meta", std::ios::binary | std::ios::trunc);
    out << std::string(sampledir::meta::kMetaBlockSize, static_cast<char>(0xFF));
  }

  bool threw = false;
  try {
    (void)SampleFileDir::Open(path, identity);
  } catch (const sampledir::util::FormatError&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteRequiresEmptyDirectory() {
  const auto path     = FreshDir("delete");
  const auto identity = MakeIdentity();
  auto       dir      = SampleFileDir::Create(path, identity);
  dir.BeginOpen(MakeOpen(1));
  dir.CompleteOpen();

  WriteSampleFile(path, "0000000100000001");
  assert(dir.HasSampleFiles());

  bool threw = false;
  try {
    dir.Delete();
  } catch (const InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(dir.Tracker().State() == OpenState::kStable);

  std::filesystem::remove(path / "0000000100000001");
  assert(!dir.HasSampleFiles());
  dir.Delete();
  assert(dir.Tracker().State() == OpenState::kEmpty);

  auto meta = SampleFileDir::ReadMeta(path);
  assert(meta.has_value());
  assert(!meta->has_last_complete_open());
  assert(!meta->has_in_progress_open());
  assert(meta->dir_uuid() == identity.dir_uuid());
}

void TestDeleteResumesAfterCrash() {
  const auto path     = FreshDir("delete_resume");
  const auto identity = MakeIdentity();
  {
    auto dir = SampleFileDir::Create(path, identity);
    dir.BeginOpen(MakeOpen(1));
    dir.CompleteOpen();
    // Crash between the two deletion steps.
    dir.Tracker().BeginDelete();
  }

  // The database dropped its completed open when deletion began.
  auto dir = SampleFileDir::Open(path, identity);
  assert(dir.Tracker().State() == OpenState::kOpening);

  dir.Delete();
  assert(dir.Tracker().State() == OpenState::kEmpty);

  auto meta = SampleFileDir::ReadMeta(path);
  assert(!meta->has_last_complete_open());
  assert(!meta->has_in_progress_open());
  assert(meta->dir_uuid() == identity.dir_uuid());
}

void TestCustomMetaFileName() {
  const auto path     = FreshDir("custom_name");
  const auto identity = MakeIdentity();
  (void)SampleFileDir::Create(path, identity, "dirmeta");

  assert(std::filesystem::exists(path / "dirmeta"));
  assert(!std::filesystem::exists(path / "meta"));
  auto dir = SampleFileDir::Open(path, identity, "dirmeta");
  assert(!dir.HasSampleFiles());
}

} // namespace

int main() {
  TestCreateWritesIdentityOnlyRecord();
  TestCreateRefusesNonEmptyDirectory();
  TestCreateRefusesForeignSidecar();
  TestCreateRecoversFromUnreadableSidecar();
  TestCreateRefusesSidecarWithOpens();
  TestLifecyclePersistsAcrossReopen();
  TestOpenDetectsMismatches();
  TestOpenReportsCorruptSidecar();
  TestDeleteRequiresEmptyDirectory();
  TestDeleteResumesAfterCrash();
  TestCustomMetaFileName();

  std::cout << "sampledir_unit_sample_file_dir: pass\n";
  return 0;
}
