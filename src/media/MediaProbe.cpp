#include "MediaProbe.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
}

MediaProbe::MediaProbe() = default;
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, QString::fromUtf8(errBuf));
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot find stream info: %1").arg(filePath);
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.containerFormat = QString(fmtCtx->iformat->name);
    m_info.duration = (fmtCtx->duration > 0)
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;
        const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);

        if (par->codec_type == AVMEDIA_TYPE_VIDEO && !m_info.hasVideo) {
            m_info.hasVideo = true;
            m_info.videoCodec = desc ? QString(desc->name) : "unknown";

            // Container duration is missing for some raw streams
            if (m_info.duration <= 0.0 && stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
                m_info.duration = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
            }
        }
        else if (par->codec_type == AVMEDIA_TYPE_AUDIO && !m_info.hasAudio) {
            m_info.hasAudio = true;
            m_info.audioCodec = desc ? QString(desc->name) : "unknown";
        }
    }

    avformat_close_input(&fmtCtx);

    if (m_info.duration <= 0.0) {
        m_error = QString("Unknown duration: %1").arg(filePath);
        return false;
    }
    return true;
}
