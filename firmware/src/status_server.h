#pragma once
#include <memory>
#include <string>
#include <vector>
#include <WiFi.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "CommandHandler.h"
#include "RTOSConfig.h"
#include "StatusBroadcaster.h"
#include "rtos_mutex.h"

/**
 * One connected TCP client
 *
 * Written by whichever task broadcasts, read by the network task; the
 * mutex serializes both on the socket.
 */
class TcpStatusListener : public StatusListener {
public:
    static constexpr size_t MAX_LINE = 512;

    explicit TcpStatusListener(const WiFiClient& client) : client_(client) {}

    bool send(const std::string& payload) override;

    /**
     * Drain received bytes, appending each complete line to lines
     * Oversized lines are dropped whole.
     * @return false once the peer has disconnected
     */
    bool readLines(std::vector<std::string>& lines);

    void close();
    std::string remoteAddress();

    bool valid() const { return mutex_.valid(); }

private:
    RtosMutex mutex_;
    WiFiClient client_;
    std::string partial_;
    bool overflowed_ = false;
};

/**
 * JSON-lines command server on TCP (default port 8080)
 *
 * Each line is one command object. Every client is also a status
 * listener: it gets the current status on connect and after every
 * command that was applied.
 */
class StatusServer {
public:
    static constexpr uint16_t DEFAULT_PORT = 8080;
    static constexpr size_t MAX_CLIENTS = 4;

    StatusServer(ClientRegistry& clients, CommandHandler& handler,
                 StatusBroadcaster& broadcaster, uint16_t port = DEFAULT_PORT)
        : clients_(clients)
        , handler_(handler)
        , broadcaster_(broadcaster)
        , server_(port, MAX_CLIENTS)
        , port_(port)
    {
    }

    bool start();

private:
    static void taskFunction(void* params);
    void run();

    void acceptClients();
    void serviceClients();
    void handleLine(const std::string& line, TcpStatusListener& from);

    ClientRegistry& clients_;
    CommandHandler& handler_;
    StatusBroadcaster& broadcaster_;
    WiFiServer server_;
    const uint16_t port_;
    TaskHandle_t handle_ = nullptr;

    // Owned by the network task only
    std::vector<std::shared_ptr<TcpStatusListener>> sessions_;

    static constexpr UBaseType_t PRIORITY = RTOS::NORMAL_PRIORITY;
    static constexpr uint32_t STACK_SIZE = RTOS::LARGE_STACK_SIZE;
    static constexpr BaseType_t CORE = RTOS::NETWORK_CORE;
    static constexpr uint32_t POLL_MS = 10;
};
