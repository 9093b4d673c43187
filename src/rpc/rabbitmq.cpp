#include "rpc/rabbitmq.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include <thread>
#include "common/exceptions.hpp"

namespace grader::rpc {
using namespace std;

rabbitmq::rabbitmq(const amqp &amqp) : config(amqp), write(true) {
    connect();
}

rabbitmq::rabbitmq(const amqp &amqp, const string &queue, const string &routing_key)
    : config(amqp), queue(queue), routing_key(routing_key), write(false) {
    connect();
}

void rabbitmq::connect() {
    try {
        channel = AmqpClient::Channel::Create(config.hostname, config.port, config.username, config.password);
        channel->DeclareExchange(config.exchange, config.exchange_type, /* passive */ false, /* durable */ true);
        if (!write) {  // 对于从消息队列读取消息的情况，我们需要监听队列
            channel->DeclareQueue(queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
            channel->BindQueue(queue, config.exchange, routing_key);
            channel->BasicConsume(queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, /* prefetch */ 1);
        }
    } catch (std::exception &e) {
        BOOST_THROW_EXCEPTION(network_error("RabbitMQ: unable to connect to " + config.hostname + ": " + e.what()));
    }
}

bool rabbitmq::fetch(AmqpClient::Envelope::ptr_t &envelope, int timeout) {
    lock_guard<mutex> guard(mut);
    for (int retry = 5;; --retry) {
        try {
            return channel->BasicConsumeMessage(envelope, timeout);
        } catch (std::exception &e) {
            if (retry <= 0)
                BOOST_THROW_EXCEPTION(network_error(string("RabbitMQ: unable to consume message: ") + e.what()));
            LOG(WARNING) << "RabbitMQ: consuming from " << queue << " failed, reconnecting: " << e.what();
            this_thread::sleep_for(chrono::seconds(5));
            connect();
        }
    }
}

void rabbitmq::ack(const AmqpClient::Envelope::ptr_t &envelope) {
    lock_guard<mutex> guard(mut);
    try {
        channel->BasicAck(envelope);
    } catch (std::exception &e) {
        BOOST_THROW_EXCEPTION(network_error(string("RabbitMQ: unable to ack message: ") + e.what()));
    }
}

void rabbitmq::publish(const string &routing_key, const string &message) {
    lock_guard<mutex> guard(mut);
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(message);
    DLOG(INFO) << "Sending message to exchange:" << config.exchange << ", routing_key=" << routing_key << std::endl
               << message;

    try {
        channel->BasicPublish(config.exchange, routing_key, msg);
    } catch (std::exception &e) {
        LOG(WARNING) << "RabbitMQ: publishing failed, reconnecting: " << e.what();
        connect();
        try {
            channel->BasicPublish(config.exchange, routing_key, msg);
        } catch (std::exception &e) {
            BOOST_THROW_EXCEPTION(network_error(string("RabbitMQ: unable to publish message: ") + e.what()));
        }
    }
    DLOG(INFO) << "Sending message succeeded";
}

}  // namespace grader::rpc
