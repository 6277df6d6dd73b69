#include "ProgressParser.h"
#include "TimeUtil.h"
#include <QRegularExpression>
#include <algorithm>

std::optional<ExportProgress> ProgressParser::parseLine(const QString& line, double totalDuration) {
    static const QRegularExpression timeRe(R"(time=\s*(\d+:\d{2}:\d{2}(?:\.\d+)?))");
    static const QRegularExpression frameRe(R"(frame=\s*(\d+))");
    static const QRegularExpression fpsRe(R"(fps=\s*(\d+(?:\.\d+)?))");
    static const QRegularExpression bitrateRe(R"(bitrate=\s*(\d+(?:\.\d+)?)\s*kbits/s)");
    static const QRegularExpression speedRe(R"(speed=\s*(\d+(?:\.\d+)?)x)");

    auto timeMatch = timeRe.match(line);
    double elapsed = 0.0;
    if (!timeMatch.hasMatch() || !TimeUtil::parseHMS(timeMatch.captured(1), elapsed)) {
        return std::nullopt;
    }

    ExportProgress p;
    p.currentStep = ExportStep::Exporting;
    p.elapsedTime = elapsed;

    auto frameMatch = frameRe.match(line);
    if (frameMatch.hasMatch()) p.frame = frameMatch.captured(1).toLongLong();

    auto fpsMatch = fpsRe.match(line);
    if (fpsMatch.hasMatch()) p.fps = fpsMatch.captured(1).toDouble();

    auto bitrateMatch = bitrateRe.match(line);
    if (bitrateMatch.hasMatch()) p.bitrateKbps = bitrateMatch.captured(1).toDouble();

    double speed = 0.0;
    auto speedMatch = speedRe.match(line);
    if (speedMatch.hasMatch()) {
        speed = speedMatch.captured(1).toDouble();
        p.speed = speed;
    }

    if (totalDuration > 0.0) {
        p.progress = std::min(100.0, elapsed / totalDuration * 100.0);
        if (speed > 0.0) {
            p.estimatedTimeRemaining = std::max(0.0, (totalDuration - elapsed) / speed);
        }
    }
    return p;
}
