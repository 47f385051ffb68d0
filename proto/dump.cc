#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/utilities.h"
#include "proto/dumper.h"

ABSL_FLAG(std::string, input, "-", "Path of the file to read the encoded bytes from, - for stdin.");

ABSL_FLAG(bool, delimited, false,
          "Treat the input as a stream of messages, each prefixed by its size as a varint.");

ABSL_FLAG(int, max_messages, 0,
          "Stop after this many messages in --delimited mode. 0 means no limit.");

ABSL_FLAG(int, max_payload_preview, 16,
          "Number of bytes shown in hex for each length-delimited payload.");

namespace {

using ::wirepb::proto::Dumper;

class File {
 public:
  static absl::StatusOr<File> Open(std::string const& path) {
    gsl::owner<FILE*> const fp = ::fopen(path.c_str(), "r");
    if (fp != nullptr) {
      return File(fp);
    } else {
      return absl::ErrnoToStatus(errno, "fopen");
    }
  }

  ~File() { MaybeClose(); }

  File(File const&) = delete;
  File& operator=(File const&) = delete;

  File(File&& other) noexcept : fp_(other.fp_) { other.fp_ = nullptr; }

  File& operator=(File&& other) noexcept {
    MaybeClose();
    fp_ = other.fp_;
    other.fp_ = nullptr;
    return *this;
  }

  FILE* get() const { return fp_; }

 private:
  explicit File(gsl::owner<FILE*> const fp) : fp_(fp) {}

  void MaybeClose() {
    if (fp_ != nullptr) {
      LOG_IF(ERROR, ::fclose(fp_) < 0) << absl::ErrnoToStatus(errno, "fclose");
    }
  }

  gsl::owner<FILE*> fp_;
};

absl::StatusOr<std::vector<uint8_t>> ReadInput(std::string const& path) {
  if (path == "-") {
    LOG(INFO) << "reading from stdin";
    return wirepb::proto::dumper::ReadFile(stdin);
  }
  LOG(INFO) << "reading " << path;
  DEFINE_CONST_OR_RETURN(file, File::Open(path));
  return wirepb::proto::dumper::ReadFile(file.get());
}

absl::Status Run() {
  DEFINE_CONST_OR_RETURN(data, ReadInput(absl::GetFlag(FLAGS_input)));
  LOG(INFO) << "read " << data.size() << " bytes";
  int const max_messages = absl::GetFlag(FLAGS_max_messages);
  int const max_payload_preview = absl::GetFlag(FLAGS_max_payload_preview);
  Dumper::Options options;
  options.delimited = absl::GetFlag(FLAGS_delimited);
  options.max_messages = max_messages > 0 ? max_messages : 0;
  options.max_payload_preview = max_payload_preview > 0 ? max_payload_preview : 0;
  DEFINE_CONST_OR_RETURN(text, Dumper(options).Dump(data));
  ::fputs(text.c_str(), stdout);  // NOLINT
  return absl::OkStatus();
}

}  // namespace

int main(int const argc, char* argv[]) {
  absl::InitializeLog();
  absl::ParseCommandLine(argc, argv);
  auto const status = Run();
  if (!status.ok()) {
    std::string const message{status.message()};
    ::fprintf(stderr, "Error: %s\n", message.c_str());  // NOLINT
    return 1;
  }
  return 0;
}
