#include "common/testing.h"

#include "absl/debugging/failure_signal_handler.h"
#include "absl/log/initialize.h"

namespace {

// Linked into every test binary so that CHECK failures and crashes are logged with a stack trace.
class FailureSignalHandlerInstaller {
 public:
  explicit FailureSignalHandlerInstaller() {
    absl::InitializeLog();
    absl::InstallFailureSignalHandler(absl::FailureSignalHandlerOptions());
  }
};

FailureSignalHandlerInstaller failure_signal_handler_installer;

}  // namespace
