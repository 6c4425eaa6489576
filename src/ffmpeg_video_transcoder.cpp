#include "core/media_transcoder.hpp"
#include "core/ffmpeg_wrappers.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

extern "C"
{
#include <libavutil/opt.h>
}

namespace
{
    void check(int result, const std::string &what)
    {
        if (result < 0)
        {
            throw std::runtime_error(what + " failed: " + ffmpegErrorString(result));
        }
    }

    // Drain every packet the encoder has ready and mux it
    void drainEncoder(AVCodecContext *encoder, AVFormatContext *output, AVStream *stream, AVPacket *packet)
    {
        while (true)
        {
            int response = avcodec_receive_packet(encoder, packet);
            if (response == AVERROR(EAGAIN) || response == AVERROR_EOF)
                return;
            check(response, "avcodec_receive_packet");

            av_packet_rescale_ts(packet, encoder->time_base, stream->time_base);
            packet->stream_index = stream->index;
            int written = av_interleaved_write_frame(output, packet);
            av_packet_unref(packet);
            check(written, "av_interleaved_write_frame");
        }
    }
}

PixelSize FfmpegVideoTranscoder::fitWithin(int width, int height, int max_side)
{
    if (width <= 0 || height <= 0)
    {
        throw std::invalid_argument("Video dimensions must be positive");
    }
    double scale = 1.0;
    int longest = std::max(width, height);
    if (max_side > 0 && longest > max_side)
    {
        scale = static_cast<double>(max_side) / static_cast<double>(longest);
    }
    int w = static_cast<int>(width * scale);
    int h = static_cast<int>(height * scale);
    // yuv420p needs even dimensions
    w = std::max(2, w - (w % 2));
    h = std::max(2, h - (h % 2));
    return PixelSize{w, h};
}

std::optional<PixelSize> FfmpegVideoTranscoder::probe(const std::string &path)
{
    InputFormatContextRAII input;
    if (avformat_open_input(input.address(), path.c_str(), nullptr, nullptr) < 0)
    {
        Logger::warn("FFmpeg could not open " + path);
        return std::nullopt;
    }
    if (avformat_find_stream_info(input.get(), nullptr) < 0)
    {
        return std::nullopt;
    }
    for (unsigned int i = 0; i < input.get()->nb_streams; ++i)
    {
        AVCodecParameters *params = input.get()->streams[i]->codecpar;
        if (params->codec_type == AVMEDIA_TYPE_VIDEO && params->width > 0 && params->height > 0)
        {
            return PixelSize{params->width, params->height};
        }
    }
    return std::nullopt;
}

PixelSize FfmpegVideoTranscoder::transcode(const std::string &input_path, const std::string &output_path,
                                           const VideoProfile &profile)
{
    InputFormatContextRAII input;
    check(avformat_open_input(input.address(), input_path.c_str(), nullptr, nullptr), "avformat_open_input");
    check(avformat_find_stream_info(input.get(), nullptr), "avformat_find_stream_info");

    int video_index = -1;
    int audio_index = -1;
    for (unsigned int i = 0; i < input.get()->nb_streams; ++i)
    {
        AVMediaType type = input.get()->streams[i]->codecpar->codec_type;
        if (type == AVMEDIA_TYPE_VIDEO && video_index < 0)
            video_index = static_cast<int>(i);
        else if (type == AVMEDIA_TYPE_AUDIO && audio_index < 0)
            audio_index = static_cast<int>(i);
    }
    if (video_index < 0)
    {
        throw std::runtime_error("No video stream in " + input_path);
    }
    AVStream *in_video = input.get()->streams[video_index];

    // Decoder
    const AVCodec *decoder_codec = avcodec_find_decoder(in_video->codecpar->codec_id);
    if (!decoder_codec)
    {
        throw std::runtime_error("No decoder for video stream of " + input_path);
    }
    AVCodecContextRAII decoder(avcodec_alloc_context3(decoder_codec));
    if (!decoder.get())
    {
        throw std::runtime_error("avcodec_alloc_context3 failed for decoder");
    }
    check(avcodec_parameters_to_context(decoder.get(), in_video->codecpar), "avcodec_parameters_to_context");
    check(avcodec_open2(decoder.get(), decoder_codec, nullptr), "avcodec_open2 (decoder)");

    PixelSize target = fitWithin(decoder->width, decoder->height, profile.max_side);

    // Output container
    OutputFormatContextRAII output;
    check(avformat_alloc_output_context2(output.address(), nullptr, "mp4", output_path.c_str()),
          "avformat_alloc_output_context2");

    const AVCodec *encoder_codec = avcodec_find_encoder_by_name("libx264");
    if (!encoder_codec)
    {
        encoder_codec = avcodec_find_encoder(AV_CODEC_ID_H264);
    }
    if (!encoder_codec)
    {
        throw std::runtime_error("No H.264 encoder available");
    }

    AVCodecContextRAII encoder(avcodec_alloc_context3(encoder_codec));
    if (!encoder.get())
    {
        throw std::runtime_error("avcodec_alloc_context3 failed for encoder");
    }
    AVRational frame_rate = av_guess_frame_rate(input.get(), in_video, nullptr);
    if (frame_rate.num <= 0 || frame_rate.den <= 0)
    {
        frame_rate = AVRational{30, 1};
    }
    encoder->width = target.width;
    encoder->height = target.height;
    encoder->pix_fmt = AV_PIX_FMT_YUV420P;
    encoder->time_base = in_video->time_base;
    encoder->framerate = frame_rate;
    encoder->bit_rate = profile.bitrate_bps;
    encoder->rc_max_rate = profile.bitrate_bps;
    encoder->rc_buffer_size = static_cast<int>(profile.bitrate_bps * 2);
    encoder->gop_size = std::max(1, frame_rate.num / std::max(1, frame_rate.den)) * 2;
    encoder->sample_aspect_ratio = decoder->sample_aspect_ratio;
    if (output.get()->oformat->flags & AVFMT_GLOBALHEADER)
    {
        encoder->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }
    if (encoder->priv_data)
    {
        av_opt_set(encoder->priv_data, "preset", "medium", 0);
    }
    check(avcodec_open2(encoder.get(), encoder_codec, nullptr), "avcodec_open2 (encoder)");

    AVStream *out_video = avformat_new_stream(output.get(), nullptr);
    if (!out_video)
    {
        throw std::runtime_error("avformat_new_stream failed");
    }
    check(avcodec_parameters_from_context(out_video->codecpar, encoder.get()), "avcodec_parameters_from_context");
    out_video->time_base = encoder->time_base;

    AVStream *out_audio = nullptr;
    if (audio_index >= 0)
    {
        out_audio = avformat_new_stream(output.get(), nullptr);
        if (!out_audio)
        {
            throw std::runtime_error("avformat_new_stream failed for audio");
        }
        check(avcodec_parameters_copy(out_audio->codecpar, input.get()->streams[audio_index]->codecpar),
              "avcodec_parameters_copy");
        out_audio->codecpar->codec_tag = 0;
        out_audio->time_base = input.get()->streams[audio_index]->time_base;
    }

    if (!(output.get()->oformat->flags & AVFMT_NOFILE))
    {
        check(avio_open(&output.get()->pb, output_path.c_str(), AVIO_FLAG_WRITE), "avio_open");
    }
    check(avformat_write_header(output.get(), nullptr), "avformat_write_header");

    SwsContextRAII sws;
    sws.set(sws_getContext(decoder->width, decoder->height, decoder->pix_fmt, target.width, target.height,
                           AV_PIX_FMT_YUV420P, SWS_BICUBIC, nullptr, nullptr, nullptr));
    if (!sws.get())
    {
        throw std::runtime_error("sws_getContext failed");
    }

    AVFrameRAII decoded;
    AVFrameRAII scaled;
    AVPacketRAII packet;
    AVPacketRAII encoded;
    if (!decoded.get() || !scaled.get() || !packet.get() || !encoded.get())
    {
        throw std::runtime_error("FFmpeg allocation failed");
    }
    scaled->format = AV_PIX_FMT_YUV420P;
    scaled->width = target.width;
    scaled->height = target.height;
    check(av_frame_get_buffer(scaled.get(), 0), "av_frame_get_buffer");

    auto encodeDecodedFrames = [&]()
    {
        while (true)
        {
            int response = avcodec_receive_frame(decoder.get(), decoded.get());
            if (response == AVERROR(EAGAIN) || response == AVERROR_EOF)
                return;
            check(response, "avcodec_receive_frame");

            check(av_frame_make_writable(scaled.get()), "av_frame_make_writable");
            sws_scale(sws.get(), decoded->data, decoded->linesize, 0, decoded->height, scaled->data,
                      scaled->linesize);
            scaled->pts = decoded->best_effort_timestamp;
            av_frame_unref(decoded.get());

            check(avcodec_send_frame(encoder.get(), scaled.get()), "avcodec_send_frame");
            drainEncoder(encoder.get(), output.get(), out_video, encoded.get());
        }
    };

    while (av_read_frame(input.get(), packet.get()) >= 0)
    {
        if (packet->stream_index == video_index)
        {
            int sent = avcodec_send_packet(decoder.get(), packet.get());
            av_packet_unref(packet.get());
            check(sent, "avcodec_send_packet");
            encodeDecodedFrames();
        }
        else if (out_audio && packet->stream_index == audio_index)
        {
            av_packet_rescale_ts(packet.get(), input.get()->streams[audio_index]->time_base, out_audio->time_base);
            packet->stream_index = out_audio->index;
            packet->pos = -1;
            int written = av_interleaved_write_frame(output.get(), packet.get());
            av_packet_unref(packet.get());
            check(written, "av_interleaved_write_frame (audio)");
        }
        else
        {
            av_packet_unref(packet.get());
        }
    }

    // Flush decoder then encoder
    check(avcodec_send_packet(decoder.get(), nullptr), "avcodec_send_packet (flush)");
    encodeDecodedFrames();
    check(avcodec_send_frame(encoder.get(), nullptr), "avcodec_send_frame (flush)");
    drainEncoder(encoder.get(), output.get(), out_video, encoded.get());

    check(av_write_trailer(output.get()), "av_write_trailer");

    Logger::info("Transcoded " + input_path + " to " + std::to_string(target.width) + "x" +
                 std::to_string(target.height) + " at " + std::to_string(profile.bitrate_bps / 1000) + " kbit/s");
    return target;
}
