#include "chunklog/Options.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using chunklog::Options;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static void clearEnv() {
    ::unsetenv("CHUNKLOG_LOG_RESYNC");
    ::unsetenv("CHUNKLOG_READ_BUFFER");
}

static void testDefaults() {
    clearEnv();
    Options opts = Options::fromEnv();
    expect(opts.logResync, "resync logging on by default");
    expect(opts.readBufferSize == 4096, "default read buffer");
}

static void testLogResync() {
    clearEnv();
    for (const char* off : {"0", "false", "off"}) {
        ::setenv("CHUNKLOG_LOG_RESYNC", off, 1);
        expect(!Options::fromEnv().logResync, std::string("resync logging disabled by ") + off);
    }
    for (const char* on : {"1", "true", "on", "yes"}) {
        ::setenv("CHUNKLOG_LOG_RESYNC", on, 1);
        expect(Options::fromEnv().logResync, std::string("resync logging enabled by ") + on);
    }
}

static void testReadBuffer() {
    clearEnv();
    ::setenv("CHUNKLOG_READ_BUFFER", "8192", 1);
    expect(Options::fromEnv().readBufferSize == 8192, "read buffer from environment");

    ::setenv("CHUNKLOG_READ_BUFFER", "1", 1);
    expect(Options::fromEnv().readBufferSize == Options::kMinReadBuffer, "small read buffer raised to minimum");

    ::setenv("CHUNKLOG_READ_BUFFER", "18446744073709551615", 1);
    expect(Options::fromEnv().readBufferSize == Options::kMaxReadBuffer, "huge read buffer capped");

    ::setenv("CHUNKLOG_READ_BUFFER", "99999999999999999999999", 1);
    expect(Options::fromEnv().readBufferSize == 4096, "out of range value ignored");
}

static void testRejectedReadBuffer() {
    clearEnv();
    for (const char* bad : {"-1", " -4096", "lots", ""}) {
        ::setenv("CHUNKLOG_READ_BUFFER", bad, 1);
        expect(Options::fromEnv().readBufferSize == 4096, std::string("invalid read buffer ignored: '") + bad + "'");
    }
}

int main() {
    testDefaults();
    testLogResync();
    testReadBuffer();
    testRejectedReadBuffer();
    clearEnv();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
