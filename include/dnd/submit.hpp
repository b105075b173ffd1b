/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */


/**
 * @file submit.hpp
 * @brief Producer side: turn a notification request into a queued file.
 */

#ifndef DND_SUBMIT_HPP_
#define DND_SUBMIT_HPP_

#include "dnd/log.hpp"
#include "dnd/process.hpp"
#include "dnd/record.hpp"
#include "dnd/spool.hpp"
#include "dnd/vocabulary.hpp"

#include <ctime>
#include <string>
#include <utility>
#include <vector>

namespace dnd {

struct SubmitRequest {
  optional<std::string> created;
  optional<std::string> src_host;
  /// Ordered destinations; the first reachable one wins.
  std::vector<std::string> destinations;
  std::vector<std::string> commands;
  std::vector<std::string> comments;
  /// Additional key = value fields, written in this order.
  std::vector<std::pair<std::string, std::string>> fields;
  /// Write here instead of the spool queue directory.
  optional<std::string> target_dir;
};

/** @brief Request pre-filled the way the dnd_send tool fills it. */
inline SubmitRequest MakeSubmitRequest(const std::string& src_host) {
  SubmitRequest req;
  req.created = std::to_string(static_cast<long long>(::time(nullptr)));
  req.src_host = src_host;
  return req;
}

/** @brief Record that Submit() would write for @p req. */
inline Record ToRecord(const SubmitRequest& req) {
  Record rec;
  rec.created = req.created;
  rec.src_host = req.src_host;
  for (const auto& kv : req.fields) rec.SetExtra(kv.first, kv.second);
  rec.dst_hosts = req.destinations;
  rec.commands = req.commands;
  rec.comments = req.comments;
  return rec;
}

/**
 * @brief Write @p req as a new queue entry.
 * @return Full path of the created file.
 */
inline expected<std::string, SpoolError> Submit(const SubmitRequest& req,
                                                const SpoolStore& spool) {
  DND_LOG_INFO("Submit", "request to write spool file by user \"%s\"",
               CurrentUser().c_str());
  const std::string content = RecordToString(ToRecord(req));
  auto created = req.target_dir ? SpoolStore::CreateQueuedIn(req.target_dir.value(), content)
                                : spool.CreateQueued(content);
  if (created) {
    DND_LOG_INFO("Submit", "wrote file: \"%s\"", created.value().c_str());
  }
  return created;
}

}  // namespace dnd

#endif  // DND_SUBMIT_HPP_
