/**
 * @file native_library.cpp
 * @brief dlopen-based loader for libclipboard
 */

#include <cstdlib>
#include <dlfcn.h>
#include <sstream>
#include <string>
#include <vector>

#include "clipsafe/logging.h"
#include "clipsafe/native_library.h"

namespace clipsafe {

namespace {

// Flat C ABI of libclipboard
using clipboard_new_fn = clipboard_c *(*)(void *);
using clipboard_free_fn = void (*)(clipboard_c *);
using clipboard_set_text_fn = int (*)(clipboard_c *, const char *);
using clipboard_text_fn = char *(*)(clipboard_c *);
using clipboard_text_free_fn = void (*)(clipboard_c *, char *);
using clipboard_set_image_fn = int (*)(clipboard_c *, const uint8_t *, int);
using clipboard_image_fn = uint8_t *(*)(clipboard_c *, int *);
using clipboard_image_free_fn = void (*)(clipboard_c *, uint8_t *);
using clipboard_flag_fn = int (*)(clipboard_c *);

/**
 * @brief Capability surface backed by a dlopen'ed libclipboard
 */
class DynamicClipboardApi : public NativeClipboardApi {
public:
  explicit DynamicClipboardApi(void *library) : library_(library) {}

  ~DynamicClipboardApi() override {
    if (library_) {
      dlclose(library_);
    }
  }

  DynamicClipboardApi(const DynamicClipboardApi &) = delete;
  DynamicClipboardApi &operator=(const DynamicClipboardApi &) = delete;

  /**
   * @brief Resolve every symbol
   * @return Name of the first missing symbol, empty when all resolved
   */
  std::string resolve_all() {
    if (!resolve("clipboard_new", new_))
      return "clipboard_new";
    if (!resolve("clipboard_free", free_))
      return "clipboard_free";
    if (!resolve("clipboard_set_text", set_text_))
      return "clipboard_set_text";
    if (!resolve("clipboard_text", text_))
      return "clipboard_text";
    if (!resolve("clipboard_text_free", text_free_))
      return "clipboard_text_free";
    if (!resolve("clipboard_set_image", set_image_))
      return "clipboard_set_image";
    if (!resolve("clipboard_image", image_))
      return "clipboard_image";
    if (!resolve("clipboard_image_free", image_free_))
      return "clipboard_image_free";
    if (!resolve("clipboard_has_text", has_text_))
      return "clipboard_has_text";
    if (!resolve("clipboard_has_image", has_image_))
      return "clipboard_has_image";
    if (!resolve("clipboard_has_ownership", has_ownership_))
      return "clipboard_has_ownership";
    if (!resolve("clipboard_poll", poll_))
      return "clipboard_poll";
    if (!resolve("clipboard_clear", clear_))
      return "clipboard_clear";
    return "";
  }

  // libclipboard does not expose creation options yet
  clipboard_c *create() override { return new_(nullptr); }
  void destroy(clipboard_c *cb) override { free_(cb); }

  int set_text(clipboard_c *cb, const char *text) override {
    return set_text_(cb, text);
  }
  char *get_text(clipboard_c *cb) override { return text_(cb); }
  void free_text(clipboard_c *cb, char *text) override { text_free_(cb, text); }

  int set_image(clipboard_c *cb, const uint8_t *data, int length) override {
    return set_image_(cb, data, length);
  }
  uint8_t *get_image(clipboard_c *cb, int *length) override {
    return image_(cb, length);
  }
  void free_image(clipboard_c *cb, uint8_t *data) override {
    image_free_(cb, data);
  }

  int has_text(clipboard_c *cb) override { return has_text_(cb); }
  int has_image(clipboard_c *cb) override { return has_image_(cb); }
  int has_ownership(clipboard_c *cb) override { return has_ownership_(cb); }
  int poll(clipboard_c *cb) override { return poll_(cb); }
  int clear(clipboard_c *cb) override { return clear_(cb); }

private:
  template <typename Fn> bool resolve(const char *name, Fn &out) {
    dlerror();
    void *symbol = dlsym(library_, name);
    if (!symbol) {
      return false;
    }
    out = reinterpret_cast<Fn>(symbol);
    return true;
  }

  void *library_ = nullptr;

  clipboard_new_fn new_ = nullptr;
  clipboard_free_fn free_ = nullptr;
  clipboard_set_text_fn set_text_ = nullptr;
  clipboard_text_fn text_ = nullptr;
  clipboard_text_free_fn text_free_ = nullptr;
  clipboard_set_image_fn set_image_ = nullptr;
  clipboard_image_fn image_ = nullptr;
  clipboard_image_free_fn image_free_ = nullptr;
  clipboard_flag_fn has_text_ = nullptr;
  clipboard_flag_fn has_image_ = nullptr;
  clipboard_flag_fn has_ownership_ = nullptr;
  clipboard_flag_fn poll_ = nullptr;
  clipboard_flag_fn clear_ = nullptr;
};

std::vector<std::string> split_search_path(const std::string &value) {
  std::vector<std::string> dirs;
  std::istringstream stream(value);
  std::string dir;
  while (std::getline(stream, dir, ':')) {
    if (!dir.empty()) {
      dirs.push_back(dir);
    }
  }
  return dirs;
}

} // namespace

// ============================================================================
// Discovery
// ============================================================================

std::vector<std::string> native_library_candidates() {
  const std::string prefixed =
      std::string("lib") + NATIVE_LIBRARY_NAME + CLIPSAFE_SHARED_LIBRARY_SUFFIX;
  const std::string bare =
      std::string(NATIVE_LIBRARY_NAME) + CLIPSAFE_SHARED_LIBRARY_SUFFIX;

  std::vector<std::string> candidates = {prefixed, bare};

  for (const char *dir : {"/usr/local/lib", "/usr/lib"}) {
    candidates.push_back(std::string(dir) + "/" + prefixed);
  }
  for (const char *dir : {"/usr/local/lib", "/usr/lib"}) {
    candidates.push_back(std::string(dir) + "/" + bare);
  }

  const char *search_path = std::getenv(CLIPSAFE_LIBRARY_PATH_ENV);
  if (search_path) {
    for (const auto &dir : split_search_path(search_path)) {
      candidates.push_back(dir + "/" + prefixed);
      candidates.push_back(dir + "/" + bare);
    }
  }

  return candidates;
}

// ============================================================================
// Loading
// ============================================================================

Result<std::shared_ptr<NativeClipboardApi>>
load_native_clipboard(const std::string &explicit_path) {
  auto logger = logging::get();

  std::vector<std::string> candidates;
  if (explicit_path.empty()) {
    candidates = native_library_candidates();
  } else {
    candidates.push_back(explicit_path);
  }

  void *library = nullptr;
  std::string loaded_from;
  std::string last_error;

  for (const auto &candidate : candidates) {
    library = dlopen(candidate.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (library) {
      loaded_from = candidate;
      break;
    }

    const char *err = dlerror();
    if (err) {
      last_error = err;
    }
    logger->trace("Native clipboard library not at {}", candidate);
  }

  if (!library) {
    return Error(ErrorCode::LibraryNotFound,
                 "Native libclipboard library not found. Ensure the library "
                 "is available in the application's runtime path.",
                 last_error);
  }

  auto api = std::make_shared<DynamicClipboardApi>(library);
  auto missing = api->resolve_all();
  if (!missing.empty()) {
    return Error(ErrorCode::LibraryNotFound,
                 "Native library at " + loaded_from +
                     " is not a compatible libclipboard",
                 "missing symbol " + missing);
  }

  logger->debug("Loaded native clipboard library from {}", loaded_from);
  return std::shared_ptr<NativeClipboardApi>(std::move(api));
}

} // namespace clipsafe
