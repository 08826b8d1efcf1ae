#include "../common/assertions.hpp"
#include "../common/fake_camera.hpp"
#include "../common/temp_dir.hpp"
#include "files/remote_fs.hpp"
#include "gphoto/device_session.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

int main() {
  using gpcam::files::Directory;
  using gpcam::files::File;
  using gpcam::files::FileInfo;
  using gpcam::files::FileType;
  using gpcam::files::OneShotSequence;
  using gpcam::gphoto::DeviceSession;
  using gpcam::gphoto::Error;
  using gpcam::gphoto::ErrorCode;
  using gpcam::gphoto::NativeApi;
  using gpcam::gphoto::NativeHandle;
  using gpcam::tests::common::AssertContains;
  using gpcam::tests::common::CreateUniqueTempDir;
  using gpcam::tests::common::Fail;
  using gpcam::tests::common::FakeCamera;
  using gpcam::tests::common::FakeCameraHandle;
  using gpcam::tests::common::MakeFakeNativeApi;
  using gpcam::tests::common::ReadFileToString;
  using gpcam::tests::common::RemovePathBestEffort;

  FakeCamera fake;
  fake.folders["/"] = {"store_00010001"};
  fake.folders["/store_00010001"] = {"DCIM"};
  fake.folders["/store_00010001/DCIM"] = {"100CANON"};
  fake.AddFile("/store_00010001/DCIM/100CANON", "IMG_0001.JPG", "0123456789");
  fake.AddFile("/store_00010001/DCIM/100CANON", "IMG_0002.JPG", "abc");
  const NativeApi api = MakeFakeNativeApi(fake);

  auto session = std::make_shared<DeviceSession>(
      api, NativeHandle<GPContext>(&api, api.context_new()),
      NativeHandle<Camera>(&api, FakeCameraHandle()));

  const Directory root = Directory::Root(session);
  const Directory album = root.Locate("store_00010001/DCIM/100CANON/");
  if (album.path() != "/store_00010001/DCIM/100CANON" || album.name() != "100CANON") {
    Fail("locate should normalize the path: " + album.path());
  }
  if (!(album.Parent().Parent() == root.Child("store_00010001"))) {
    Fail("parent and child should be inverse operations");
  }
  if (!root.IsRoot() || !root.name().empty() || root.Parent().path() != "/") {
    Fail("root should be its own parent");
  }

  {
    // Listings hand out each entry once.
    OneShotSequence<File> listing;
    Error error;
    if (!album.Files(listing, error) || listing.remaining() != 2U) {
      Fail("album should list two files");
    }
    File first;
    File second;
    File extra;
    if (!listing.Next(first) || !listing.Next(second) || listing.Next(extra)) {
      Fail("listing should yield exactly two files");
    }
    if (first.path() != "/store_00010001/DCIM/100CANON/IMG_0001.JPG" ||
        !(first.Parent() == album)) {
      Fail("listed files should know their folder");
    }
    if (!listing.exhausted() || listing.Next(extra)) {
      Fail("a consumed listing stays empty");
    }

    OneShotSequence<File> again;
    if (!album.Files(again, error) || again.remaining() != 2U) {
      Fail("a new call should list again");
    }
  }

  {
    OneShotSequence<Directory> children;
    Error error;
    if (!root.Directories(children, error)) {
      Fail("root should list folders");
    }
    const std::vector<Directory> drained = children.Drain();
    if (drained.size() != 1U || drained.front().path() != "/store_00010001") {
      Fail("root should contain the storage folder");
    }

    bool exists = false;
    if (!album.Exists(exists, error) || !exists) {
      Fail("listed folder should exist");
    }
    if (!root.Child("missing").Exists(exists, error) || exists) {
      Fail("unlisted folder should not exist");
    }
  }

  {
    Error error;
    if (root.Create(error) || error.code != ErrorCode::kDirectoryExists) {
      Fail("creating the root should fail with kDirectoryExists");
    }
    if (root.Remove(error) || error.code != ErrorCode::kInvalidPath) {
      Fail("removing the root should fail with kInvalidPath");
    }
    const Directory created = album.Child("exports");
    if (!created.Create(error)) {
      Fail("create should succeed: " + gpcam::gphoto::FormatError(error));
    }
    bool exists = false;
    if (!created.Exists(exists, error) || !exists) {
      Fail("created folder should be listed by its parent");
    }
    if (!created.Remove(error) || !created.Exists(exists, error) || exists) {
      Fail("removed folder should disappear");
    }
  }

  const File image = album.FileNamed("IMG_0001.JPG");
  {
    FileInfo info;
    Error error;
    if (!image.FetchInfo(info, error)) {
      Fail("info should be available: " + gpcam::gphoto::FormatError(error));
    }
    if (info.size != 10U || info.mime_type != std::string(GP_MIME_JPEG) ||
        info.width.has_value()) {
      Fail("info should only carry the fields the driver flagged");
    }
    if (info.PermissionsText() != "r-") {
      Fail("read-only permissions should render as r-");
    }
    if (FileInfo{}.PermissionsText() != "--" ||
        FileInfo{.permissions = GP_FILE_PERM_ALL}.PermissionsText() != "rw") {
      Fail("unexpected permission rendering");
    }
  }

  {
    FileInfo info;
    Error error;
    if (album.FileNamed("IMG_9999.JPG").FetchInfo(info, error)) {
      Fail("missing file should have no info");
    }
    if (error.code != ErrorCode::kFileNotFound || error.native_code != GP_ERROR_FILE_NOT_FOUND) {
      Fail("missing file should report kFileNotFound with the native code");
    }
    AssertContains(error.message, "are you sure the file exists on the device?");
  }

  {
    std::vector<std::uint8_t> data;
    Error error;
    if (!image.GetData(FileType::kNormal, data, error) ||
        std::string(data.begin(), data.end()) != "0123456789") {
      Fail("get data should return the file contents");
    }

    std::string streamed;
    std::vector<std::size_t> chunk_sizes;
    const bool ok = image.ReadChunks(
        4U, FileType::kNormal,
        [&](const std::uint8_t* bytes, std::size_t size) {
          streamed.append(reinterpret_cast<const char*>(bytes), size);
          chunk_sizes.push_back(size);
        },
        error);
    if (!ok || streamed != "0123456789") {
      Fail("chunked read should deliver the whole file in order");
    }
    if (chunk_sizes != std::vector<std::size_t>{4U, 4U, 2U}) {
      Fail("chunked read should advance by the chunk size");
    }
    if (image.ReadChunks(0U, FileType::kNormal, [](const std::uint8_t*, std::size_t) {}, error) ||
        error.code != ErrorCode::kInvalidValue) {
      Fail("zero chunk size should be rejected");
    }
  }

  const auto temp_root = CreateUniqueTempDir("gpcam-remote-fs");
  {
    Error error;
    const auto target = temp_root / "IMG_0001.JPG";
    if (!image.Save(target, FileType::kNormal, error)) {
      Fail("save should succeed: " + gpcam::gphoto::FormatError(error));
    }
    if (ReadFileToString(target) != "0123456789") {
      Fail("saved file should hold the remote contents");
    }

    const int gets_before = fake.file_get_calls;
    if (image.Save(temp_root / "raw.CR2", FileType::kRaw, error) ||
        error.code != ErrorCode::kUnsupportedFileType) {
      Fail("raw transfer should be rejected when the driver does not advertise it");
    }
    if (fake.file_get_calls != gets_before) {
      Fail("unsupported transfers should not reach the device");
    }

    if (image.Save(temp_root / "missing-dir" / "x.jpg", FileType::kNormal, error) ||
        error.code != ErrorCode::kLocalIo) {
      Fail("unwritable target should fail with kLocalIo");
    }

    const auto orphan = temp_root / "IMG_9999.JPG";
    if (album.FileNamed("IMG_9999.JPG").Save(orphan, FileType::kNormal, error) ||
        error.code != ErrorCode::kFileNotFound) {
      Fail("saving a missing remote file should fail with kFileNotFound");
    }
    if (std::filesystem::exists(orphan)) {
      Fail("failed download should not leave a local file behind");
    }
  }

  {
    const auto local = temp_root / "upload.txt";
    std::ofstream(local) << "notes";
    Error error;
    if (!album.Upload(local, error)) {
      Fail("upload should succeed: " + gpcam::gphoto::FormatError(error));
    }
    if (fake.uploaded != std::vector<std::string>{"/store_00010001/DCIM/100CANON/upload.txt"}) {
      Fail("upload should target the folder under the local file name");
    }
    if (album.Upload(temp_root / "absent.txt", error) || error.code != ErrorCode::kLocalIo) {
      Fail("missing local file should fail with kLocalIo");
    }
  }

  {
    Error error;
    if (!album.FileNamed("IMG_0002.JPG").Remove(error)) {
      Fail("remove should succeed");
    }
    if (fake.deleted != std::vector<std::string>{"/store_00010001/DCIM/100CANON/IMG_0002.JPG"}) {
      Fail("remove should delete the named file");
    }

    std::vector<std::string> operations;
    if (!image.SupportedOperations(operations, error) ||
        operations != std::vector<std::string>{"remove", "extract_preview"}) {
      Fail("file operations should come from the abilities");
    }
  }

  if (fake.exit_calls == 0) {
    Fail("operations should release the device connection");
  }

  {
    Error error;
    OneShotSequence<File> unbound;
    if (Directory().Files(unbound, error) || error.code != ErrorCode::kNotInitialized) {
      Fail("unbound directories should report kNotInitialized");
    }
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
