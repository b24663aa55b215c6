#include "server/rabbitmq.hpp"

#include <sys/prctl.h>

#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader::server {
using namespace std;

static AmqpClient::BasicMessage::ptr_t make_message(const string &body) {
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(body);
    msg->ContentType("application/json");
    msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
    return msg;
}

rabbitmq_channel::rabbitmq_channel(const amqp &amqp, bool write, bool dead_lettering)
    : queue(amqp), write(write), dead_lettering(dead_lettering) {
    try {
        connect();
    } catch (const std::exception &ex) {
        BOOST_THROW_EXCEPTION(broker_unavailable() << "Unable to connect to " << queue.exchange << ": " << ex.what());
    }
    if (write) {
        write_thread = std::thread([this]() {
            prctl(PR_SET_NAME, "mq write loop", 0, 0, 0);
            this->message_write_loop();
        });
    }
}

rabbitmq_channel::~rabbitmq_channel() {
    shutdown = true;
    if (write_thread.joinable()) write_thread.join();
}

string rabbitmq_channel::retry_queue() const {
    return queue.queue + ".retry";
}

string rabbitmq_channel::dead_queue() const {
    return queue.queue + ".dead";
}

void rabbitmq_channel::connect() {
    channel = AmqpClient::Channel::Open(AmqpClient::Channel::OpenOpts::FromUri(queue.uri));
    ++generation;

    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
    if (dead_lettering) {
        // 被拒绝且不重新入队的任务经默认 exchange 进入死信队列
        AmqpClient::Table work_args;
        work_args.insert(AmqpClient::TableEntry(AmqpClient::TableKey("x-dead-letter-exchange"), AmqpClient::TableValue(string())));
        work_args.insert(AmqpClient::TableEntry(AmqpClient::TableKey("x-dead-letter-routing-key"), AmqpClient::TableValue(dead_queue())));
        channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false, work_args);

        // 重试队列没有消费者，消息过期后回到工作队列
        AmqpClient::Table retry_args;
        retry_args.insert(AmqpClient::TableEntry(AmqpClient::TableKey("x-dead-letter-exchange"), AmqpClient::TableValue(queue.exchange)));
        retry_args.insert(AmqpClient::TableEntry(AmqpClient::TableKey("x-dead-letter-routing-key"), AmqpClient::TableValue(queue.routing_key)));
        channel->DeclareQueue(retry_queue(), /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false, retry_args);

        channel->DeclareQueue(dead_queue(), /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    } else {
        channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    }
    channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);

    if (!write) {  // 对于从消息队列读取消息的情况，我们需要监听队列
        tag = channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, queue.concurrency);
    }
}

void rabbitmq_channel::try_connect(bool force) {
    try {
        connect();
    } catch (const std::exception &ex) {
        LOG_ERROR << "Failed to connect, cause: " << ex.what();
        if (force) throw;
    }
}

unique_ptr<delivery> rabbitmq_channel::fetch(chrono::milliseconds timeout) {
    if (write) BOOST_THROW_EXCEPTION(grader_exception() << "Channel " << queue.queue << " is opened for writing only");

    for (int retry = 0;; retry++) {
        try {
            scoped_lock guard(mut);
            AmqpClient::Envelope::ptr_t envelope;
            if (!channel->BasicConsumeMessage(tag, envelope, (int)timeout.count()))
                return nullptr;
            return make_unique<rabbitmq_envelope>(*this, envelope, generation);
        } catch (const std::exception &ex) {
            LOG_DEBUG << "Fetching message failed, retry: " << retry << ", cause: " << ex.what();
            if (retry >= queue.retries)
                BOOST_THROW_EXCEPTION(broker_unavailable() << "Unable to fetch from " << queue.queue << ": " << ex.what());
            this_thread::sleep_for(chrono::milliseconds(1000));
            scoped_lock guard(mut);
            try_connect(false);
        }
    }
}

void rabbitmq_channel::send(const string &exchange, const string &routing_key, const AmqpClient::BasicMessage::ptr_t &message) {
    for (int retry = 0;; retry++) {
        try {
            scoped_lock guard(mut);
            // 信道处于 confirm 模式，BasicPublish 在 broker 确认后才返回
            channel->BasicPublish(exchange, routing_key, message, /* mandatory */ true);
            return;
        } catch (const std::exception &ex) {
            LOG_DEBUG << "Sending message failed, retry: " << retry << ", cause: " << ex.what();
            if (retry >= queue.retries)
                BOOST_THROW_EXCEPTION(broker_unavailable() << "Unable to publish to " << exchange << "/" << routing_key << ": " << ex.what());
            this_thread::sleep_for(chrono::milliseconds(1000));
            scoped_lock guard(mut);
            try_connect(false);
        }
    }
}

void rabbitmq_channel::publish(const job_message &message) {
    send(queue.exchange, queue.routing_key, make_message(nlohmann::json(message).dump()));
}

void rabbitmq_channel::publish_delayed(const job_message &message, chrono::milliseconds delay) {
    if (!dead_lettering) BOOST_THROW_EXCEPTION(grader_exception() << "Queue " << queue.queue << " has no retry queue");
    if (delay.count() <= 0) {
        publish(message);
        return;
    }

    AmqpClient::BasicMessage::ptr_t msg = make_message(nlohmann::json(message).dump());
    msg->Expiration(to_string(delay.count()));
    send("", retry_queue(), msg);
}

void rabbitmq_channel::ack(const rabbitmq_envelope &envelope) {
    scoped_lock guard(mut);
    if (envelope.generation != generation) {
        // 连接已经重建，broker 会重新投递这条消息
        LOG_WARN << "Channel reconnected since delivery, skip ack of " << envelope.envelope->DeliveryTag();
        return;
    }
    try {
        channel->BasicAck(envelope.envelope);
    } catch (const std::exception &ex) {
        BOOST_THROW_EXCEPTION(broker_unavailable() << "Unable to ack delivery: " << ex.what());
    }
}

void rabbitmq_channel::reject(const rabbitmq_envelope &envelope, bool requeue) {
    scoped_lock guard(mut);
    if (envelope.generation != generation) {
        LOG_WARN << "Channel reconnected since delivery, skip reject of " << envelope.envelope->DeliveryTag();
        return;
    }
    try {
        channel->BasicReject(envelope.envelope, requeue);
    } catch (const std::exception &ex) {
        BOOST_THROW_EXCEPTION(broker_unavailable() << "Unable to reject delivery: " << ex.what());
    }
}

void rabbitmq_channel::message_write_loop() {
    LOG_DEBUG << "Start message write loop for exchange: " << queue.exchange;
    pending_message message;
    while (!shutdown) {
        if (!write_queue.pop_for(message, chrono::milliseconds(100))) continue;

        AmqpClient::BasicMessage::ptr_t msg = make_message(message.message);
        for (int retry = 0; !shutdown; retry++) {
            try {
                scoped_lock guard(mut);
                LOG_DEBUG << "report: sending message to exchange:" << queue.exchange
                          << ", routing_key=" << message.routing_key;
                channel->BasicPublish(queue.exchange, message.routing_key, msg);
                break;
            } catch (const std::exception &ex) {
                LOG_DEBUG << "Sending message failed, retry: " << retry << ", cause: " << ex.what();
                this_thread::sleep_for(chrono::milliseconds(1000));
                scoped_lock guard(mut);
                try_connect(false);
            }
        }
    }
    if (write_queue.size() > 0)
        LOG_WARN << "server shutdown, dropping " << write_queue.size() << " pending messages";
    LOG_DEBUG << "server shutdown, exiting message write loop";
}

void rabbitmq_channel::report(const string &message) {
    report(message, queue.routing_key);
}

void rabbitmq_channel::report(const string &message, const string &routing_key) {
    if (!write) BOOST_THROW_EXCEPTION(grader_exception() << "Channel " << queue.queue << " is not opened for writing");
    write_queue.push({message, routing_key});
}

rabbitmq_envelope::rabbitmq_envelope(rabbitmq_channel &owner, AmqpClient::Envelope::ptr_t envelope, unsigned generation)
    : owner(owner), envelope(move(envelope)), generation(generation) {}

string rabbitmq_envelope::body() const {
    return envelope->Message()->Body();
}

bool rabbitmq_envelope::redelivered() const {
    return envelope->Redelivered();
}

void rabbitmq_envelope::do_ack() {
    owner.ack(*this);
}

void rabbitmq_envelope::do_reject(bool requeue) {
    owner.reject(*this, requeue);
}

}  // namespace grader::server
