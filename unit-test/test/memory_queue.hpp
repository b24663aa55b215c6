#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/exceptions.hpp"
#include "server/job_queue.hpp"

namespace grader::test {

/**
 * @brief 内存中的消息队列，至少一次投递
 * 每个投递在确认或拒绝之前只属于一个消费者，拒绝并重新入队的消息会被再次投递
 */
struct memory_broker {
    void push(const std::string &body, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        {
            std::scoped_lock guard(mut);
            if (unavailable) BOOST_THROW_EXCEPTION(broker_unavailable() << "memory broker is down");
            ready.push_back({body, false, std::chrono::steady_clock::now() + delay});
            ++published_count;
        }
        cv.notify_all();
    }

    /**
     * @return 投递编号，超时返回 0
     */
    uint64_t claim(std::chrono::milliseconds timeout, std::string &body, bool &redelivered) {
        std::unique_lock guard(mut);
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto now = std::chrono::steady_clock::now();
            for (auto it = ready.begin(); it != ready.end(); ++it) {
                if (it->visible_at <= now) {
                    uint64_t tag = ++next_tag;
                    body = it->body;
                    redelivered = it->redelivered;
                    in_flight[tag] = *it;
                    ready.erase(it);
                    return tag;
                }
            }
            if (now >= deadline) return 0;
            cv.wait_for(guard, std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(5)));
        }
    }

    void ack(uint64_t tag) {
        std::scoped_lock guard(mut);
        in_flight.erase(tag);
        ++acked_count;
    }

    void reject(uint64_t tag, bool requeue) {
        {
            std::scoped_lock guard(mut);
            auto message = in_flight.at(tag);
            in_flight.erase(tag);
            if (requeue) {
                message.redelivered = true;
                message.visible_at = std::chrono::steady_clock::now();
                ready.push_back(message);
                ++requeued_count;
            } else {
                dead_letters.push_back(message.body);
            }
        }
        cv.notify_all();
    }

    std::size_t pending() {
        std::scoped_lock guard(mut);
        return ready.size() + in_flight.size();
    }

    std::vector<std::string> dead() {
        std::scoped_lock guard(mut);
        return dead_letters;
    }

    std::size_t acked() {
        std::scoped_lock guard(mut);
        return acked_count;
    }

    std::size_t requeued() {
        std::scoped_lock guard(mut);
        return requeued_count;
    }

    std::size_t published() {
        std::scoped_lock guard(mut);
        return published_count;
    }

    void set_unavailable(bool value) {
        std::scoped_lock guard(mut);
        unavailable = value;
    }

private:
    struct message {
        std::string body;
        bool redelivered = false;
        std::chrono::steady_clock::time_point visible_at;
    };

    std::mutex mut;
    std::condition_variable cv;
    std::deque<message> ready;
    std::map<uint64_t, message> in_flight;
    std::vector<std::string> dead_letters;
    uint64_t next_tag = 0;
    std::size_t acked_count = 0, requeued_count = 0, published_count = 0;
    bool unavailable = false;
};

struct memory_delivery : server::delivery {
    memory_delivery(memory_broker &broker, uint64_t tag, std::string content, bool again)
        : broker(broker), tag(tag), content(std::move(content)), again(again) {}

    /**
     * @brief 消费者放弃投递（例如崩溃）时消息重新入队
     */
    ~memory_delivery() {
        if (!settled()) broker.reject(tag, true);
    }

    std::string body() const override { return content; }
    bool redelivered() const override { return again; }

protected:
    void do_ack() override { broker.ack(tag); }
    void do_reject(bool requeue) override { broker.reject(tag, requeue); }

private:
    memory_broker &broker;
    uint64_t tag;
    std::string content;
    bool again;
};

/**
 * @brief 某个消费者到 memory_broker 的连接
 */
struct memory_queue : server::job_queue {
    explicit memory_queue(memory_broker &broker) : broker(broker) {}

    void publish(const job_message &message) override {
        broker.push(nlohmann::json(message).dump());
    }

    void publish_delayed(const job_message &message, std::chrono::milliseconds delay) override {
        broker.push(nlohmann::json(message).dump(), delay);
    }

    std::unique_ptr<server::delivery> fetch(std::chrono::milliseconds timeout) override {
        std::string body;
        bool redelivered = false;
        uint64_t tag = broker.claim(timeout, body, redelivered);
        if (!tag) return nullptr;
        return std::make_unique<memory_delivery>(broker, tag, body, redelivered);
    }

private:
    memory_broker &broker;
};

}  // namespace grader::test
