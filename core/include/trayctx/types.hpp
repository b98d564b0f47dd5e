#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trayctx {

// Native handles (HWND, HMENU, HICON, HANDLE) travel as integers so that the
// core never includes <windows.h>.
using native_handle = std::uint64_t;
using native_id = std::uint32_t;

// Raw ICO directory bytes handed to the icon image collaborator.
struct IconBuffer {
  std::vector<std::uint8_t> bytes;
  std::uint32_t width{};
  std::uint32_t height{};
};

// Index into the image set registered on a WindowBuilder.
struct ImageId {
  std::uint32_t index{};

  bool operator==(const ImageId &o) const { return index == o.index; }
  bool operator!=(const ImageId &o) const { return index != o.index; }
};

struct MenuItemState {
  std::optional<std::string> label;
  std::optional<bool> checked;
  std::optional<bool> enabled;
  std::optional<bool> highlight;

  bool empty() const {
    return !label && !checked && !enabled && !highlight;
  }
};

enum class ClipboardFormat : std::uint8_t {
  Text,   // UTF-8 on our side, CF_UNICODETEXT natively
  Bitmap, // CF_DIBV5 bytes
};

struct ClipboardData {
  ClipboardFormat format = ClipboardFormat::Text;
  std::vector<std::uint8_t> bytes;

  static ClipboardData text(const std::string &s) {
    return {ClipboardFormat::Text, std::vector<std::uint8_t>(s.begin(), s.end())};
  }
  std::string as_text() const { return std::string(bytes.begin(), bytes.end()); }
};

// Identifies the receiving window of a WM_COPYDATA transfer.
struct CopyDataTarget {
  std::string class_name;
  std::string window_name; // empty matches any title
};

} // namespace trayctx
