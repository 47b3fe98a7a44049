#include "GeneralUtils.h"
#include <algorithm>
#include <array>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/remove_whitespace.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <date/date.h>
#include <exception>
#include <folly/experimental/exception_tracer/ExceptionTracer.h>
#include <folly/experimental/exception_tracer/StackTrace.h>
#include <iostream>
#include <thread>

// From https://github.com/kenba/via-httplib/blob/master/include/via/http/authentication/base64.hpp
auto base64Encode(std::string input) -> std::string
{
    // The input must be in multiples of 3, otherwise the transformation
    // may overflow the input buffer, so pad with zero.
    const uint32_t num_pad_chars((3 - input.size() % 3) % 3);
    input.append(num_pad_chars, 0);

    // Transform to Base64
    using boost::archive::iterators::transform_width, boost::archive::iterators::base64_from_binary;
    // NOLINTNEXTLINE (cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    using ItBase64T = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
    std::string output(ItBase64T(input.begin()),
                       ItBase64T(input.end() - num_pad_chars));

    // Pad blank characters with =
    output.append(num_pad_chars, '=');

    return output;
}

// From https://github.com/kenba/via-httplib/blob/master/include/via/http/authentication/base64.hpp
auto base64Decode(std::string input) -> std::string
{
    using boost::archive::iterators::transform_width, boost::archive::iterators::remove_whitespace, boost::archive::iterators::binary_from_base64;

    // NOLINTNEXTLINE (cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    using ItBinaryT = transform_width<binary_from_base64<remove_whitespace<std::string::const_iterator>>, 8, 6>;

    try
    {
        // If the input isn't a multiple of 4, pad with =
        const uint32_t num_pad_chars((4 - input.size() % 4) % 4);
        input.append(num_pad_chars, '=');

        const uint32_t pad_chars(std::count(input.begin(), input.end(), '='));
        std::replace(input.begin(), input.end(), '=', 'A');
        std::string output(ItBinaryT(input.begin()), ItBinaryT(input.end()));
        output.erase(output.end() - pad_chars, output.end());
        return output;
    }
    catch (std::exception& e)
    {
        dumpExceptions(e);
        return {""};
    }
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers,cppcoreguidelines-pro-bounds-constant-array-index)
auto generateTimeOrderedUUID() -> std::string {
    // Version 7 layout: 48 bit unix millisecond timestamp, 4 bit version, 12 bit sequence, 2 bit variant, 62 random
    // bits. The sequence keeps identifiers generated in the same millisecond by this process in order.
    static std::mutex sequenceMutex;
    static uint64_t lastMillis = 0;
    static uint16_t sequence = 0;

    auto millis = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()
            ).count()
    );

    uint16_t currentSequence = 0;
    {
        std::unique_lock<std::mutex> const lock(sequenceMutex);
        if (millis <= lastMillis) {
            millis = lastMillis;
            sequence = static_cast<uint16_t>((sequence + 1) & 0x0FFF);
            if (sequence == 0) {
                // Sequence exhausted, borrow the next millisecond
                millis = ++lastMillis;
            }
        } else {
            lastMillis = millis;
            sequence = 0;
        }
        currentSequence = sequence;
    }

    auto uuid = boost::uuids::random_generator()();
    for (auto i = 0; i < 6; i++) {
        uuid.data[i] = static_cast<uint8_t>(millis >> (40 - 8 * i));
    }
    uuid.data[6] = static_cast<uint8_t>(0x70 | ((currentSequence >> 8) & 0x0F));
    uuid.data[7] = static_cast<uint8_t>(currentSequence & 0xFF);
    uuid.data[8] = static_cast<uint8_t>((uuid.data[8] & 0x3F) | 0x80);

    return boost::uuids::to_string(uuid);
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers,cppcoreguidelines-pro-bounds-constant-array-index)

auto collectionBasename(const std::string& collectionPath) -> std::string {
    // Everything after the final separator, so "dir/" yields an empty name
    auto separator = collectionPath.find_last_of('/');
    if (separator == std::string::npos) {
        return collectionPath;
    }

    return collectionPath.substr(separator + 1);
}

auto formatTimestamp(std::chrono::system_clock::time_point timestamp) -> std::string {
    return date::format("%F %T", date::floor<std::chrono::microseconds>(timestamp));
}

void dumpExceptions(std::exception& exception) {
    std::cerr << "--- Exception: " << exception.what() << '\n';
    auto exceptions = folly::exception_tracer::getCurrentExceptions();
    for (auto& exc : exceptions) {
        std::cerr << exc << "\n";
    }
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto acceptingConnections(uint16_t port) -> bool {
    using boost::asio::io_service, boost::asio::ip::tcp;
    using ec = boost::system::error_code;

    bool result = false;

    for (auto counter = 0; counter < 10 && !result; counter++) {
        try {
            io_service svc;
            tcp::socket socket(svc);
            boost::asio::steady_timer tim(svc, std::chrono::milliseconds(100));

            tim.async_wait([&](ec) { socket.cancel(); });
            socket.async_connect({{}, port}, [&](ec errorCode) {
                result = !errorCode;
            });

            svc.run();
        } catch (boost::system::system_error& e) {
            // The port is not accepting yet, try again
            std::cerr << "Port " << port << " not ready: " << e.what() << std::endl;
        }

        if (!result) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    return result;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// To prevent the compiler optimizing away the exception tracing from folly, we need to reference it.
extern "C" auto getCaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTrace*;
extern "C" auto getUncaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTraceStack*;

// forceExceptionStackTraceRef is intentionally unused and marked volatile so the compiler doesn't optimize away the
// required functions from folly.
volatile void forceExceptionStackTraceRef()
{
    getCaughtExceptionStackTraceStack();
    getUncaughtExceptionStackTraceStack();
}
