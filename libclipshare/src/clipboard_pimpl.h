#ifndef CLIPSHARE_CLIPBOARD_PIMPL_H
#define CLIPSHARE_CLIPBOARD_PIMPL_H

#include "clipshare/clipboard.h"
#include <mutex>
#include <optional>

namespace clipshare {

class XclipClipboard::Impl {
public:
  ClipboardEnvironmentOptions options;

  // Resolved once, first call wins
  std::once_flag resolve_once;
  ClipboardEnvironment environment;

  // The helper and the temporary file form one critical section per write
  std::mutex write_mutex;
};

// Platform hooks
ClipboardEnvironment
platform_resolve_environment(const ClipboardEnvironmentOptions &options);
Result<ClipboardSnapshot>
platform_read_clipboard(const ClipboardEnvironment &env);
Result<void> platform_write_clipboard(const ClipboardEnvironment &env,
                                      const Bytes &data,
                                      const std::string &mime_type);

} // namespace clipshare

#endif // CLIPSHARE_CLIPBOARD_PIMPL_H
