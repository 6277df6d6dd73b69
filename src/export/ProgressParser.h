#pragma once

#include <QString>
#include <optional>
#include "ExportTypes.h"

// Turns one line of the tool's diagnostic output into a progress update.
//
//   frame= 1234 fps= 30 q=-1.0 size= 10240kB time=00:00:41.13 bitrate=2039.5kbits/s speed=1.0x
//
// Fields are extracted independently and missing ones are left unset. Lines
// without a time= field (banner, stream mapping, warnings) yield nothing.
// Stateless: nothing carries over between lines.
class ProgressParser {
public:
    static std::optional<ExportProgress> parseLine(const QString& line, double totalDuration);
};
