#pragma once
#ifdef _WIN32
#include <windows.h>
#include <cstdint>
#include <string>
#include "types.hpp"

namespace trayctx {

inline native_handle to_native(const void* h) {
    return static_cast<native_handle>(reinterpret_cast<std::uintptr_t>(h));
}

template <typename H>
inline H from_native(native_handle h) {
    return reinterpret_cast<H>(static_cast<std::uintptr_t>(h));
}

inline std::wstring u82w(const std::string& s) {
    if (s.empty()) return {};
    int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
    std::wstring w(n, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), w.data(), n);
    return w;
}

inline std::string w2u8(const std::wstring& w) {
    if (w.empty()) return {};
    int n = WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), nullptr, 0, nullptr, nullptr);
    std::string s(n, '\0');
    WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), s.data(), n, nullptr, nullptr);
    return s;
}

// Copies `src` into a fixed-size WCHAR field, truncating and terminating.
template <size_t N>
inline void copy_truncated(WCHAR (&dst)[N], const std::wstring& src) {
    size_t n = src.size() < N - 1 ? src.size() : N - 1;
    wmemcpy(dst, src.data(), n);
    dst[n] = L'\0';
}

class SafeHandle {
public:
    SafeHandle(HANDLE h = NULL) : h_(h) {}
    ~SafeHandle() { reset(); }
    SafeHandle(SafeHandle&& other) noexcept : h_(other.h_) { other.h_ = NULL; }
    SafeHandle& operator=(SafeHandle&& other) noexcept {
        if (this != static_cast<const void*>(&other)) {
            reset();
            h_ = other.h_;
            other.h_ = NULL;
        }
        return *this;
    }
    operator HANDLE() const { return h_; }
    HANDLE get() const { return h_; }
    HANDLE release() { HANDLE h = h_; h_ = NULL; return h; }
    bool is_valid() const { return h_ != INVALID_HANDLE_VALUE && h_ != NULL; }
private:
    void reset() {
        if (is_valid()) CloseHandle(h_);
        h_ = NULL;
    }
    HANDLE h_;
    SafeHandle(const SafeHandle&) = delete;
    SafeHandle& operator=(const SafeHandle&) = delete;
};

class HKey {
public:
    HKey(HKEY h = NULL) : h_(h) {}
    ~HKey() { if (h_ != NULL && h_ != HKEY_CURRENT_USER && h_ != HKEY_LOCAL_MACHINE) RegCloseKey(h_); }
    HKey(HKey&& other) noexcept : h_(other.h_) { other.h_ = NULL; }
    HKey& operator=(HKey&& other) noexcept {
        if (this != static_cast<const void*>(&other)) {
            if (h_ != NULL && h_ != HKEY_CURRENT_USER && h_ != HKEY_LOCAL_MACHINE) RegCloseKey(h_);
            h_ = other.h_;
            other.h_ = NULL;
        }
        return *this;
    }
    operator HKEY() const { return h_; }
    HKEY* operator&() { return &h_; }
    bool is_valid() const { return h_ != NULL; }
private:
    HKEY h_;
    HKey(const HKey&) = delete;
    HKey& operator=(const HKey&) = delete;
};

class OwnedIcon {
public:
    explicit OwnedIcon(HICON h = NULL) : h_(h) {}
    ~OwnedIcon() { if (h_) DestroyIcon(h_); }
    OwnedIcon(OwnedIcon&& other) noexcept : h_(other.h_) { other.h_ = NULL; }
    OwnedIcon& operator=(OwnedIcon&& other) noexcept {
        if (this != &other) {
            if (h_) DestroyIcon(h_);
            h_ = other.h_;
            other.h_ = NULL;
        }
        return *this;
    }
    HICON get() const { return h_; }
private:
    HICON h_;
    OwnedIcon(const OwnedIcon&) = delete;
    OwnedIcon& operator=(const OwnedIcon&) = delete;
};

// Open clipboard for the duration of a scope.
class ClipboardLock {
public:
    explicit ClipboardLock(HWND owner) : open_(OpenClipboard(owner) != FALSE) {}
    ~ClipboardLock() { if (open_) CloseClipboard(); }
    bool is_open() const { return open_; }
private:
    bool open_;
    ClipboardLock(const ClipboardLock&) = delete;
    ClipboardLock& operator=(const ClipboardLock&) = delete;
};

class GlobalMemLock {
public:
    explicit GlobalMemLock(HGLOBAL h) : h_(h), p_(GlobalLock(h)) {}
    ~GlobalMemLock() { if (p_) GlobalUnlock(h_); }
    void* get() const { return p_; }
private:
    HGLOBAL h_;
    void* p_;
    GlobalMemLock(const GlobalMemLock&) = delete;
    GlobalMemLock& operator=(const GlobalMemLock&) = delete;
};

} // namespace trayctx
#endif
