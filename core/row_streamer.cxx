/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024. Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */
#include "row_streamer.hxx"

#include "logger/logger.hxx"
#include "row_decoder.hxx"

#include <relay/error_codes.hxx>

#include <mutex>
#include <utility>

namespace relay::core
{
class row_streamer_impl : public std::enable_shared_from_this<row_streamer_impl>
{
public:
  row_streamer_impl(std::shared_ptr<io::http_body_reader> body, const std::string& pointer_expression)
    : body_{ std::move(body) }
    , decoder_{ pointer_expression }
  {
  }

  void start(row_streamer::header_handler&& handler)
  {
    {
      const std::scoped_lock lock(mutex_);
      header_handler_ = std::move(handler);
    }
    pump();
  }

  void next_row(row_streamer::row_handler&& handler)
  {
    bool canceled{ false };
    {
      const std::scoped_lock lock(mutex_);
      canceled = canceled_;
      if (!canceled) {
        row_handler_ = std::move(handler);
      }
    }
    if (canceled) {
      return handler(errc::common::request_canceled, {});
    }
    pump();
  }

  void cancel()
  {
    row_streamer::header_handler header_handler{};
    row_streamer::row_handler row_handler{};
    {
      const std::scoped_lock lock(mutex_);
      if (canceled_) {
        return;
      }
      canceled_ = true;
      header_handler = std::move(header_handler_);
      row_handler = std::move(row_handler_);
    }
    body_->cancel();
    if (header_handler) {
      header_handler(errc::common::request_canceled, {});
    }
    if (row_handler) {
      row_handler(errc::common::request_canceled, {});
    }
  }

  auto metadata() const -> std::optional<std::string>
  {
    const std::scoped_lock lock(mutex_);
    return decoder_.metadata();
  }

private:
  /**
   * Serves whatever the decoder can answer, and reads the next chunk when a handler still waits.
   */
  void pump()
  {
    row_streamer::header_handler header_handler{};
    row_streamer::row_handler row_handler{};
    std::error_code header_ec{};
    std::string header{};
    std::error_code row_ec{};
    std::optional<std::string> row{};
    bool read_more{ false };
    {
      const std::scoped_lock lock(mutex_);
      if (canceled_) {
        return;
      }
      if (header_handler_) {
        if (const auto& available = decoder_.metadata_header(); available) {
          header = available.value();
          header_handler = std::move(header_handler_);
        } else if (decoder_.input_complete()) {
          header_ec = decoder_.err() ? decoder_.err() : std::error_code{ errc::common::protocol_failure };
          header_handler = std::move(header_handler_);
        }
      }
      if (row_handler_) {
        if (row = decoder_.next(); row) {
          row_handler = std::move(row_handler_);
        } else if (decoder_.end_of_stream()) {
          row_ec = decoder_.err();
          row_handler = std::move(row_handler_);
        }
      }
      read_more = (header_handler_ || row_handler_) && !reading_ && !decoder_.input_complete();
      if (read_more) {
        reading_ = true;
      }
    }

    if (header_handler) {
      header_handler(header_ec, std::move(header));
    }
    if (row_handler) {
      row_handler(row_ec, std::move(row));
    }
    if (read_more) {
      read();
    }
  }

  void read()
  {
    body_->next([self = shared_from_this()](std::error_code ec, std::string chunk, bool complete) {
      {
        const std::scoped_lock lock(self->mutex_);
        self->reading_ = false;
        if (self->canceled_) {
          return;
        }
        if (ec) {
          RELAY_LOG_DEBUG("row stream interrupted: {}", ec.message());
          self->decoder_.fail(ec);
        } else {
          self->decoder_.feed(chunk);
          if (complete) {
            self->decoder_.finish();
          }
        }
      }
      self->pump();
    });
  }

  std::shared_ptr<io::http_body_reader> body_;
  mutable std::mutex mutex_{};
  row_decoder decoder_;
  row_streamer::header_handler header_handler_{};
  row_streamer::row_handler row_handler_{};
  bool reading_{ false };
  bool canceled_{ false };
};

row_streamer::row_streamer(std::shared_ptr<io::http_body_reader> body, const std::string& pointer_expression)
  : impl_{ std::make_shared<row_streamer_impl>(std::move(body), pointer_expression) }
{
}

void
row_streamer::start(header_handler&& handler)
{
  impl_->start(std::move(handler));
}

void
row_streamer::next_row(row_handler&& handler)
{
  impl_->next_row(std::move(handler));
}

void
row_streamer::cancel()
{
  impl_->cancel();
}

auto
row_streamer::metadata() const -> std::optional<std::string>
{
  return impl_->metadata();
}
} // namespace relay::core
