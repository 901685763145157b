#include "audio_utils.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/log.h>
#include <libavutil/opt.h>
}

#include <sys/stat.h>

namespace readalong {

// Owns every FFmpeg object of one decode pass
struct AudioDecodeState {
	AVFormatContext *format_ctx = nullptr;
	AVCodecContext *codec_ctx = nullptr;
	SwrContext *swr_ctx = nullptr;
	AVPacket *packet = nullptr;
	AVFrame *frame = nullptr;
	int stream_idx = -1;

	~AudioDecodeState() {
		if (packet) {
			av_packet_free(&packet);
		}
		if (frame) {
			av_frame_free(&frame);
		}
		if (swr_ctx) {
			swr_free(&swr_ctx);
		}
		if (codec_ctx) {
			avcodec_free_context(&codec_ctx);
		}
		if (format_ctx) {
			avformat_close_input(&format_ctx);
		}
	}
};

static bool OpenAudioStream(const std::string &file_path, AudioDecodeState &state, std::string &error) {
	if (avformat_open_input(&state.format_ctx, file_path.c_str(), nullptr, nullptr) < 0) {
		error = "Failed to open audio file: " + file_path;
		return false;
	}
	if (avformat_find_stream_info(state.format_ctx, nullptr) < 0) {
		error = "Failed to find stream info";
		return false;
	}
	state.stream_idx = av_find_best_stream(state.format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
	if (state.stream_idx < 0) {
		error = "No audio stream found in file";
		return false;
	}
	return true;
}

static bool OpenDecoder(AudioDecodeState &state, std::string &error) {
	AVCodecParameters *codecpar = state.format_ctx->streams[state.stream_idx]->codecpar;

	const AVCodec *codec = avcodec_find_decoder(codecpar->codec_id);
	if (!codec) {
		error = "Unsupported audio codec";
		return false;
	}
	state.codec_ctx = avcodec_alloc_context3(codec);
	if (!state.codec_ctx) {
		error = "Failed to allocate codec context";
		return false;
	}
	if (avcodec_parameters_to_context(state.codec_ctx, codecpar) < 0) {
		error = "Failed to copy codec parameters";
		return false;
	}
	if (avcodec_open2(state.codec_ctx, codec, nullptr) < 0) {
		error = "Failed to open codec";
		return false;
	}

	// Resample to 16kHz mono float32
	AVChannelLayout out_ch_layout = AV_CHANNEL_LAYOUT_MONO;
	AVChannelLayout in_ch_layout;
	if (state.codec_ctx->ch_layout.nb_channels > 0) {
		av_channel_layout_copy(&in_ch_layout, &state.codec_ctx->ch_layout);
	} else {
		av_channel_layout_default(&in_ch_layout,
		                          codecpar->ch_layout.nb_channels > 0 ? codecpar->ch_layout.nb_channels : 2);
	}
	swr_alloc_set_opts2(&state.swr_ctx, &out_ch_layout, AV_SAMPLE_FMT_FLT, AudioUtils::WHISPER_SAMPLE_RATE,
	                    &in_ch_layout, state.codec_ctx->sample_fmt, state.codec_ctx->sample_rate, 0, nullptr);
	av_channel_layout_uninit(&in_ch_layout);

	if (!state.swr_ctx || swr_init(state.swr_ctx) < 0) {
		error = "Failed to initialize resampler";
		return false;
	}

	state.packet = av_packet_alloc();
	state.frame = av_frame_alloc();
	if (!state.packet || !state.frame) {
		error = "Failed to allocate packet/frame";
		return false;
	}
	return true;
}

// Convert one decoded frame (or flush the resampler when frame is null)
static void AppendResampled(AudioDecodeState &state, const AVFrame *frame, std::vector<float> &output) {
	int in_samples = frame ? frame->nb_samples : 0;
	int64_t delay = swr_get_delay(state.swr_ctx, state.codec_ctx->sample_rate);
	int64_t out_samples = av_rescale_rnd(delay + in_samples, AudioUtils::WHISPER_SAMPLE_RATE,
	                                     state.codec_ctx->sample_rate, AV_ROUND_UP);
	if (out_samples <= 0) {
		return;
	}

	size_t offset = output.size();
	output.resize(offset + static_cast<size_t>(out_samples));
	uint8_t *out_buf = reinterpret_cast<uint8_t *>(output.data() + offset);
	const uint8_t **in_buf = frame ? const_cast<const uint8_t **>(frame->extended_data) : nullptr;

	int converted = swr_convert(state.swr_ctx, &out_buf, static_cast<int>(out_samples), in_buf, in_samples);
	output.resize(offset + static_cast<size_t>(converted > 0 ? converted : 0));
}

static void DrainDecoder(AudioDecodeState &state, std::vector<float> &output) {
	while (avcodec_receive_frame(state.codec_ctx, state.frame) >= 0) {
		AppendResampled(state, state.frame, output);
		av_frame_unref(state.frame);
	}
}

bool AudioUtils::LoadAudioFile(const std::string &file_path, std::vector<float> &output, std::string &error) {
	AudioDecodeState state;
	if (!OpenAudioStream(file_path, state, error) || !OpenDecoder(state, error)) {
		return false;
	}

	output.clear();
	while (av_read_frame(state.format_ctx, state.packet) >= 0) {
		if (state.packet->stream_index == state.stream_idx && avcodec_send_packet(state.codec_ctx, state.packet) >= 0) {
			DrainDecoder(state, output);
		}
		av_packet_unref(state.packet);
	}

	avcodec_send_packet(state.codec_ctx, nullptr);
	DrainDecoder(state, output);
	AppendResampled(state, nullptr, output);

	if (output.empty()) {
		error = "No audio samples decoded from " + file_path;
		return false;
	}
	return true;
}

bool AudioUtils::GetAudioMetadata(const std::string &file_path, AudioMetadata &metadata, std::string &error) {
	AudioDecodeState state;
	if (!OpenAudioStream(file_path, state, error)) {
		return false;
	}

	AVStream *stream = state.format_ctx->streams[state.stream_idx];
	AVCodecParameters *codecpar = stream->codecpar;

	if (state.format_ctx->duration > 0) {
		metadata.duration_seconds = static_cast<double>(state.format_ctx->duration) / AV_TIME_BASE;
	} else if (stream->duration > 0) {
		metadata.duration_seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
	} else {
		metadata.duration_seconds = 0.0;
	}
	metadata.sample_rate = codecpar->sample_rate;
	metadata.channels = codecpar->ch_layout.nb_channels;
	metadata.format = state.format_ctx->iformat->name;

	struct stat buffer;
	metadata.file_size = stat(file_path.c_str(), &buffer) == 0 ? static_cast<int64_t>(buffer.st_size) : 0;
	return true;
}

bool AudioUtils::ProbeDuration(const std::string &file_path, double &duration_seconds, std::string &error) {
	AudioMetadata metadata;
	if (!GetAudioMetadata(file_path, metadata, error)) {
		return false;
	}
	if (metadata.duration_seconds <= 0.0) {
		error = "Container reports no duration: " + file_path;
		return false;
	}
	duration_seconds = metadata.duration_seconds;
	return true;
}

void AudioUtils::SetFFmpegLogging(bool enabled) {
	av_log_set_level(enabled ? AV_LOG_INFO : AV_LOG_QUIET);
}

} // namespace readalong
