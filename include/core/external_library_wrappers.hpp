#pragma once

#include <memory>
#include <string>

extern "C"
{
#include <libavformat/avformat.h>
}

// Owns an input AVFormatContext opened for probing; closed on destruction
class AVFormatInput
{
public:
    AVFormatInput() = default;

    AVFormatInput(const AVFormatInput &) = delete;
    AVFormatInput &operator=(const AVFormatInput &) = delete;
    AVFormatInput(AVFormatInput &&) = default;
    AVFormatInput &operator=(AVFormatInput &&) = default;

    /**
     * @brief Open a container and read its stream headers
     * @return false if the file is not a container libavformat can parse
     */
    bool open(const std::string &file_path)
    {
        AVFormatContext *raw = nullptr;
        if (avformat_open_input(&raw, file_path.c_str(), nullptr, nullptr) < 0)
            return false;
        ctx_.reset(raw);
        return avformat_find_stream_info(ctx_.get(), nullptr) >= 0;
    }

    AVFormatContext *get() const { return ctx_.get(); }
    AVFormatContext *operator->() const { return ctx_.get(); }

private:
    struct Closer
    {
        void operator()(AVFormatContext *ctx) const
        {
            avformat_close_input(&ctx);
        }
    };

    std::unique_ptr<AVFormatContext, Closer> ctx_;
};
