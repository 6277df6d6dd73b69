#pragma once

#include <cstdint>
#include <cmath>
#include <QString>
#include <QStringList>

namespace TimeUtil {

// Tool argument format: HH:MM:SS.mmm
inline QString secondsToHMSms(double totalSeconds) {
    if (totalSeconds < 0.0) totalSeconds = 0.0;
    qint64 totalMillis = static_cast<qint64>(std::llround(totalSeconds * 1000.0));
    qint64 hours = totalMillis / 3600000;
    int minutes = static_cast<int>((totalMillis % 3600000) / 60000);
    int seconds = static_cast<int>((totalMillis % 60000) / 1000);
    int millis = static_cast<int>(totalMillis % 1000);

    return QString("%1:%2:%3.%4")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

// Parses "HH:MM:SS[.frac]" as written by the tool's status line.
// Returns false when the text is not of that shape.
inline bool parseHMS(const QString& text, double& seconds) {
    const QStringList parts = text.split(':');
    if (parts.size() != 3) return false;

    bool okH = false, okM = false, okS = false;
    int h = parts[0].toInt(&okH);
    int m = parts[1].toInt(&okM);
    double s = parts[2].toDouble(&okS);
    if (!okH || !okM || !okS) return false;

    seconds = h * 3600.0 + m * 60.0 + s;
    return true;
}

inline QString formatDuration(double totalSeconds) {
    if (totalSeconds < 0.0) totalSeconds = 0.0;
    int hours = static_cast<int>(totalSeconds / 3600.0);
    int minutes = static_cast<int>(std::fmod(totalSeconds, 3600.0) / 60.0);
    int seconds = static_cast<int>(std::fmod(totalSeconds, 60.0));

    if (hours > 0) {
        return QString("%1:%2:%3")
            .arg(hours, 2, 10, QChar('0'))
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'));
    }
    return QString("%1:%2")
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'));
}

inline QString formatEstimatedTime(double seconds) {
    if (seconds < 60.0) {
        return QString("%1 seconds").arg(seconds, 0, 'f', 0);
    }
    if (seconds < 3600.0) {
        return QString("%1 minutes").arg(seconds / 60.0, 0, 'f', 1);
    }
    return QString("%1 hours").arg(seconds / 3600.0, 0, 'f', 1);
}

inline QString formatFileSize(quint64 bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    constexpr int unitCount = 4;

    if (bytes == 0) return "0 B";

    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < unitCount - 1) {
        size /= 1024.0;
        ++unit;
    }

    if (unit == 0) {
        return QString("%1 %2").arg(bytes).arg(QLatin1String(units[unit]));
    }
    return QString("%1 %2").arg(size, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

} // namespace TimeUtil
