#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "ClipForge";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "ClipForge";

    // Default external tool, resolved through PATH
    inline constexpr const char* DefaultFfmpegProgram = "ffmpeg";

    // Subdirectory of the system temp dir holding per-attempt scratch files
    inline constexpr const char* ScratchDirName = "clipforge";

    // Trim decisions tolerate float noise in the source in/out points
    inline constexpr double TrimTolerance = 0.01;
    inline constexpr double MinTrimLength = 0.1;
    // Slack for the minimum length check; 0.3 - 0.2 is just under 0.1
    inline constexpr double TrimLengthEpsilon = 1e-9;

    // Final container and codec are fixed
    inline constexpr const char* OutputFormat = "mp4";
    inline constexpr const char* OutputCodec = "h264";

    // Codecs used when a trim cannot be stream-copied
    inline constexpr const char* ReencodeVideoCodec = "libx264";
    inline constexpr const char* ReencodeAudioCodec = "aac";

    inline constexpr int DefaultToolTimeoutMs = 30 * 60 * 1000;
    inline constexpr int DefaultKillGraceMs = 5000;

    // Scratch files younger than this may belong to a running export
    inline constexpr qint64 StaleScratchAgeMs = 24LL * 60 * 60 * 1000;
}
