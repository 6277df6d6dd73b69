#pragma once

#include <QString>

struct ExportError {
    enum class Kind {
        None,
        Validation,     // malformed timeline or settings, caught before any side effect
        IO,             // creating, writing or deleting scratch artifacts
        ExternalTool,   // spawn failure or non-zero exit, carries the tool's diagnostics
        Cancelled,
        Timeout
    };

    Kind kind = Kind::None;
    QString message;

    ExportError() = default;
    ExportError(Kind k, const QString& msg) : kind(k), message(msg) {}

    bool isError() const { return kind != Kind::None; }

    static ExportError validation(const QString& msg) { return {Kind::Validation, msg}; }
    static ExportError io(const QString& msg) { return {Kind::IO, msg}; }
    static ExportError externalTool(const QString& msg) { return {Kind::ExternalTool, msg}; }
    static ExportError cancelled(const QString& msg) { return {Kind::Cancelled, msg}; }
    static ExportError timeout(const QString& msg) { return {Kind::Timeout, msg}; }

    static QString kindName(Kind k) {
        switch (k) {
        case Kind::None:         return "none";
        case Kind::Validation:   return "validation_error";
        case Kind::IO:           return "io_error";
        case Kind::ExternalTool: return "ffmpeg_error";
        case Kind::Cancelled:    return "cancelled";
        case Kind::Timeout:      return "timeout";
        }
        return "unknown";
    }
};
