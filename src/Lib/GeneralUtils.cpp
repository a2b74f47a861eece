//
// General utilities: base64, uuids, exception dumps and port checks
//

#include "GeneralUtils.h"
#include <algorithm>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/remove_whitespace.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <cstdio>
#include <execinfo.h>
#include <folly/experimental/exception_tracer/ExceptionTracer.h>
#include <folly/experimental/exception_tracer/StackTrace.h>
#include <iostream>
#include <segvcatch.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace {
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    using BinaryToBase64 = boost::archive::iterators::base64_from_binary<
            boost::archive::iterators::transform_width<std::string::const_iterator, 6, 8>
    >;
    using Base64ToBinary = boost::archive::iterators::transform_width<
            boost::archive::iterators::binary_from_base64<
                    boost::archive::iterators::remove_whitespace<std::string::const_iterator>
            >, 8, 6
    >;
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
}

auto base64Encode(const std::string &input) -> std::string {
    // The iterators work on whole 3 byte groups, so the tail is zero filled and then replaced by '=' padding
    auto padding = (3 - input.size() % 3) % 3;
    auto padded = input;
    padded.append(padding, '\0');

    std::string output(BinaryToBase64(padded.cbegin()), BinaryToBase64(padded.cend() - static_cast<long>(padding)));
    output.append(padding, '=');
    return output;
}

auto base64Decode(const std::string &input) -> std::string {
    // Unpadded input is accepted, the secret config is often pasted without its trailing '='
    auto padded = input;
    padded.append((4 - padded.size() % 4) % 4, '=');

    auto padding = static_cast<std::size_t>(std::count(padded.begin(), padded.end(), '='));
    std::replace(padded.begin(), padded.end(), '=', 'A');

    try {
        std::string output(Base64ToBinary(padded.cbegin()), Base64ToBinary(padded.cend()));
        output.erase(output.end() - static_cast<long>(std::min(padding, output.size())), output.end());
        return output;
    } catch (const boost::archive::iterators::dataflow_exception &e) {
        throw std::invalid_argument("Input is not valid base64: " + std::string(e.what()));
    }
}

auto generateUUID() -> std::string {
    auto uuid = boost::uuids::random_generator()();
    return boost::uuids::to_string(uuid);
}

void dumpExceptions(const std::exception& exception) {
    std::cerr << "--- Exception: " << exception.what() << '\n';
    auto exceptions = folly::exception_tracer::getCurrentExceptions();
    for (auto& exc : exceptions) {
        std::cerr << exc << "\n";
    }
}

void handleSegv()
{
    // NOLINTBEGIN
    void *array[10];
    int size;

    size = backtrace(array, 10);

    fprintf(stderr, "Error: SEGFAULT:\n");
    backtrace_symbols_fd(array, size, STDERR_FILENO);

    throw std::runtime_error("Seg Fault Error");
    // NOLINTEND
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
auto acceptingConnections(uint16_t port, uint32_t attempts) -> bool {
    using boost::asio::io_context, boost::asio::ip::tcp;
    using ec = boost::system::error_code;

    for (uint32_t attempt = 0; attempt < attempts; attempt++) {
        bool connected = false;

        io_context svc;
        tcp::socket socket(svc);
        boost::asio::steady_timer timer(svc, std::chrono::milliseconds(100));

        timer.async_wait([&socket](ec) { socket.close(); });
        socket.async_connect({boost::asio::ip::address_v4::loopback(), port}, [&connected, &timer](ec errorCode) {
            connected = !errorCode;
            timer.cancel();
        });

        svc.run();

        if (connected) {
            return true;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return false;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// Referencing the folly tracer hooks keeps the linker from dropping them, without them dumpExceptions prints no stack
extern "C" auto getCaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTrace*;
extern "C" auto getUncaughtExceptionStackTraceStack() -> const folly::exception_tracer::StackTraceStack*;

volatile void forceExceptionStackTraceRef()
{
    getCaughtExceptionStackTraceStack();
    getUncaughtExceptionStackTraceStack();
}

// Installs the crash handler during static initialisation
auto forceStartup() -> bool {
    segvcatch::init_segv(&handleSegv);
    return true;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables,cert-err58-cpp)
volatile bool bForceStartup = forceStartup();
