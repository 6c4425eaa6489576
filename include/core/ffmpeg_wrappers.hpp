#pragma once

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libswscale/swscale.h>
}

#include <string>

// RAII wrapper for a demuxing AVFormatContext
class InputFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    InputFormatContextRAII() : ctx_(nullptr) {}
    ~InputFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    InputFormatContextRAII(const InputFormatContextRAII &) = delete;
    InputFormatContextRAII &operator=(const InputFormatContextRAII &) = delete;
};

// RAII wrapper for a muxing AVFormatContext; closes the output file too
class OutputFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    OutputFormatContextRAII() : ctx_(nullptr) {}
    ~OutputFormatContextRAII()
    {
        if (!ctx_)
            return;
        if (ctx_->oformat && !(ctx_->oformat->flags & AVFMT_NOFILE) && ctx_->pb)
            avio_closep(&ctx_->pb);
        avformat_free_context(ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    OutputFormatContextRAII(const OutputFormatContextRAII &) = delete;
    OutputFormatContextRAII &operator=(const OutputFormatContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}
    explicit AVCodecContextRAII(AVCodecContext *existing_ctx) : ctx_(existing_ctx) {}

    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }
    AVCodecContext *operator->() { return ctx_; }

    // Disable copy
    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}

    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() { return frame_; }
    AVFrame *operator->() { return frame_; }

    // Disable copy
    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}

    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() { return packet_; }
    AVPacket *operator->() { return packet_; }

    // Disable copy
    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;
};

// RAII wrapper for FFmpeg SwsContext
class SwsContextRAII
{
private:
    SwsContext *ctx_;

public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContext *get() { return ctx_; }
    void set(SwsContext *c)
    {
        if (ctx_)
            sws_freeContext(ctx_);
        ctx_ = c;
    }

    // Disable copy
    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;
};

inline std::string ffmpegErrorString(int errnum)
{
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, buffer, sizeof(buffer));
    return std::string(buffer);
}
