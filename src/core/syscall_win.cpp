#include "subrepl/core/syscall.hpp"

#include <array>
#include <expected>
#include <string>

#include <windows.h>

namespace subrepl::core::syscall {

auto close_handle(NativeHandle handle) -> Result<void> {
  if (CloseHandle(handle) == 0) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }
  return {};
}

auto create_pipe() -> Result<std::array<NativeHandle, 2>> {
  SECURITY_ATTRIBUTES attributes{};
  attributes.nLength        = sizeof(attributes);
  attributes.bInheritHandle = FALSE;

  HANDLE read_end  = nullptr;
  HANDLE write_end = nullptr;
  if (CreatePipe(&read_end, &write_end, &attributes, 0) == 0) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }
  return std::array<NativeHandle, 2>{read_end, write_end};
}

auto write_handle(NativeHandle handle, std::string_view data) -> Result<size_t> {
  DWORD written = 0;
  if (WriteFile(handle, data.data(), static_cast<DWORD>(data.size()), &written, nullptr) == 0) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }
  if (FlushFileBuffers(handle) == 0 && GetLastError() != ERROR_INVALID_FUNCTION) {
    return std::unexpected(static_cast<int>(GetLastError()));
  }
  return static_cast<size_t>(written);
}

auto read_handle(NativeHandle handle, char* buffer, size_t size) -> Result<size_t> {
  DWORD read = 0;
  if (ReadFile(handle, buffer, static_cast<DWORD>(size), &read, nullptr) == 0) {
    DWORD error = GetLastError();
    // The writer closed its end: that is end of stream, not an error
    if (error == ERROR_BROKEN_PIPE || error == ERROR_HANDLE_EOF) {
      return 0;
    }
    return std::unexpected(static_cast<int>(error));
  }
  return static_cast<size_t>(read);
}

auto error_string(int error_code) -> std::string {
  LPSTR buffer = nullptr;
  DWORD length = FormatMessageA(
      FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
      nullptr,
      static_cast<DWORD>(error_code),
      0,
      reinterpret_cast<LPSTR>(&buffer),
      0,
      nullptr
  );
  if (length == 0 || buffer == nullptr) {
    return "error " + std::to_string(error_code);
  }
  std::string message(buffer, length);
  LocalFree(buffer);
  while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
    message.pop_back();
  }
  return message;
}

} // namespace subrepl::core::syscall
