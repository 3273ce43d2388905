#pragma once

#include <string>

namespace zb {

struct ZbError {
    enum Code {
        // Resolution
        UnknownFormula,
        CyclicDependency,
        VersionConflict,
        UnsupportedTap,
        // Selection
        NoCompatibleBottle,
        // Fetch
        TransportFailure,
        IntegrityError,
        Timeout,
        // Store
        ExtractionFailure,
        RenameRaceLost,
        DiskFull,
        LinkConflict,
        // Lock
        LockTimeout,
        StaleLockRecovered,
        // Database
        DatabaseCorrupt,
        DatabaseIO,
        // Installer
        DependencyFailed,
        Aborted,
        NotInstalled,
        HasDependents,
        // General
        IO,
        Parse,
        Version,
        Config,
        InvalidArg,
        NotFound
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ZbError() = default;
    ZbError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ZbError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ZbError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // "error[Code]: message" plus hint / location lines when present
    std::string format() const;

    static const char* code_name(Code c);

    // Error family: "ResolutionError", "FetchError", ...
    static const char* category(Code c);
    const char* category() const { return category(code); }
};

} // namespace zb
