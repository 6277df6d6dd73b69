#include "ExportTypes.h"
#include "AppConstants.h"

namespace {

void setError(QString* error, const QString& message) {
    if (error) *error = message;
}

} // anonymous namespace

bool ExportSettings::fromStrings(const QString& resolution, const QString& quality,
                                 const QString& format, const QString& codec,
                                 ExportSettings& out, QString* error) {
    ExportSettings s;

    if (resolution == "source") s.resolution = ExportResolution::Source;
    else if (resolution == "1080p") s.resolution = ExportResolution::P1080;
    else if (resolution == "720p") s.resolution = ExportResolution::P720;
    else {
        setError(error, QString("Invalid resolution '%1'. Must be 'source', '1080p', or '720p'")
                            .arg(resolution));
        return false;
    }

    if (quality == "high") s.quality = ExportQuality::High;
    else if (quality == "medium") s.quality = ExportQuality::Medium;
    else if (quality == "low") s.quality = ExportQuality::Low;
    else {
        setError(error, QString("Invalid quality '%1'. Must be 'high', 'medium', or 'low'")
                            .arg(quality));
        return false;
    }

    s.format = format;
    s.codec = codec;
    if (!s.validate(error)) return false;

    out = s;
    return true;
}

bool ExportSettings::validate(QString* error) const {
    if (format != AppConstants::OutputFormat) {
        setError(error, QString("Invalid format '%1'. Only '%2' is supported")
                            .arg(format, QString(AppConstants::OutputFormat)));
        return false;
    }
    if (codec != AppConstants::OutputCodec) {
        setError(error, QString("Invalid codec '%1'. Only '%2' is supported")
                            .arg(codec, QString(AppConstants::OutputCodec)));
        return false;
    }
    return true;
}

QString ExportSettings::resolutionName(ExportResolution r) {
    switch (r) {
    case ExportResolution::Source: return "source";
    case ExportResolution::P1080:  return "1080p";
    case ExportResolution::P720:   return "720p";
    }
    return "source";
}

QString ExportSettings::qualityName(ExportQuality q) {
    switch (q) {
    case ExportQuality::High:   return "high";
    case ExportQuality::Medium: return "medium";
    case ExportQuality::Low:    return "low";
    }
    return "medium";
}

QStringList ExportSettings::availableResolutions() {
    return {"source", "1080p", "720p"};
}

QStringList ExportSettings::availableQualities() {
    return {"high", "medium", "low"};
}

QString exportStepName(ExportStep step) {
    switch (step) {
    case ExportStep::Idle:      return "Idle";
    case ExportStep::Preparing: return "Preparing";
    case ExportStep::Exporting: return "Exporting";
    case ExportStep::Completed: return "Completed";
    case ExportStep::Failed:    return "Failed";
    case ExportStep::Cancelled: return "Cancelled";
    }
    return "Idle";
}
