// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace clasp
{
namespace test
{

// MIDI port double. Copies share one state.
class MidiPort
{
public:
  explicit MidiPort(std::string name = "test")
    : mpState(std::make_shared<State>())
  {
    mpState->name = std::move(name);
  }

  const std::string& name() const { return mpState->name; }

  void send(const uint8_t* const pData, const std::size_t numBytes)
  {
    if (mpState->closed)
    {
      throw IoError("MIDI port " + mpState->name + " is closed");
    }
    mpState->written.insert(mpState->written.end(), pData, pData + numBytes);
  }

  template <typename Handler, typename ErrorHandler>
  void receive(Handler handler, ErrorHandler errorHandler)
  {
    mpState->callback = [handler](const std::vector<uint8_t>& bytes) mutable
    { handler(bytes.cbegin(), bytes.cend()); };
    mpState->errorCallback = [errorHandler](const std::error_code& ec) mutable
    { errorHandler(ec); };
  }

  // Delivers bytes to the pending read, if there is one
  void incoming(const std::vector<uint8_t>& bytes)
  {
    auto callback = std::move(mpState->callback);
    mpState->callback = nullptr;
    if (callback)
    {
      callback(bytes);
    }
  }

  // Fails the pending read
  void fail(const std::error_code& ec)
  {
    auto errorCallback = std::move(mpState->errorCallback);
    mpState->errorCallback = nullptr;
    mpState->callback = nullptr;
    if (errorCallback)
    {
      errorCallback(ec);
    }
  }

  bool reading() const { return static_cast<bool>(mpState->callback); }

  void close() { mpState->closed = true; }

  bool closed() const { return mpState->closed; }

  std::vector<uint8_t>& written() { return mpState->written; }

private:
  struct State
  {
    std::string name;
    std::vector<uint8_t> written;
    std::function<void(const std::vector<uint8_t>&)> callback;
    std::function<void(const std::error_code&)> errorCallback;
    bool closed = false;
  };

  std::shared_ptr<State> mpState;
};

} // namespace test
} // namespace clasp
