// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/platforms/asio/AsioWrapper.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <memory>
#include <string>
#include <unistd.h>

namespace clasp
{
namespace platforms
{
namespace asio
{

// Raw MIDI device (e.g. an ALSA /dev/snd/midiC1D0 node) read and written as
// a byte stream through an asio stream descriptor. Bytes arrive in chunks
// that do not respect message boundaries; framing is the caller's job.
class MidiPort
{
public:
  enum class Direction
  {
    Input,
    Output,
    Duplex
  };

  using Buffer = std::array<uint8_t, 256>;
  using ByteIt = Buffer::const_iterator;

  // Throws IoError if the device cannot be opened
  MidiPort(::asio::io_context& io, std::string path, const Direction direction)
    : mpImpl(std::make_shared<Impl>(io, std::move(path), direction))
  {
  }

  MidiPort(const MidiPort&) = delete;
  MidiPort& operator=(const MidiPort&) = delete;

  MidiPort(MidiPort&&) = default;
  MidiPort& operator=(MidiPort&&) = default;

  const std::string& name() const { return mpImpl->mPath; }

  // Throws IoError
  void send(const uint8_t* const pData, const std::size_t numBytes)
  {
    try
    {
      ::asio::write(mpImpl->mDescriptor, ::asio::buffer(pData, numBytes));
    }
    catch (const std::system_error& err)
    {
      throw IoError("Failed to write to MIDI port " + mpImpl->mPath + ": " + err.what());
    }
  }

  void close() { mpImpl->close(); }

  // Arms one read. The handler is called with the bytes read, the error
  // handler when the device fails or disappears.
  template <typename Handler, typename ErrorHandler>
  void receive(Handler handler, ErrorHandler errorHandler)
  {
    mpImpl->mHandler = std::move(handler);
    mpImpl->mErrorHandler = std::move(errorHandler);
    mpImpl->mDescriptor.async_read_some(
      ::asio::buffer(mpImpl->mReceiveBuffer), util::makeAsyncSafe(mpImpl));
  }

private:
  struct Impl
  {
    Impl(::asio::io_context& io, std::string path, const Direction direction)
      : mPath(std::move(path))
      , mDescriptor(io)
    {
      const int flags = direction == Direction::Input    ? O_RDONLY
                        : direction == Direction::Output ? O_WRONLY
                                                         : O_RDWR;
      const int fd = ::open(mPath.c_str(), flags | O_NONBLOCK | O_CLOEXEC);
      if (fd < 0)
      {
        throw IoError("Failed to open MIDI port " + mPath + ": " + std::strerror(errno));
      }
      mDescriptor.assign(fd);
    }

    ~Impl() { close(); }

    void close()
    {
      // The device may already be gone, errors don't matter at this point
      ::asio::error_code ec;
      mDescriptor.close(ec);
    }

    void operator()(const ::asio::error_code& error, const std::size_t numBytes)
    {
      if (error)
      {
        if (error != ::asio::error::operation_aborted && mErrorHandler)
        {
          mErrorHandler(error);
        }
      }
      else
      {
        const auto bufBegin = mReceiveBuffer.cbegin();
        mHandler(bufBegin, bufBegin + static_cast<ptrdiff_t>(numBytes));
      }
    }

    std::string mPath;
    ::asio::posix::stream_descriptor mDescriptor;
    Buffer mReceiveBuffer;
    std::function<void(ByteIt, ByteIt)> mHandler;
    std::function<void(const ::asio::error_code&)> mErrorHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace asio
} // namespace platforms
} // namespace clasp
