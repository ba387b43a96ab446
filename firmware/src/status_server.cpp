#include "status_server.h"
#include "MessageCodec.h"
#include "esp_log.h"

static const char* TAG = "SERVER";

bool TcpStatusListener::send(const std::string& payload) {
    TaskLockGuard lock(mutex_);
    if (!client_.connected()) {
        return false;
    }
    size_t written = client_.write(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    written += client_.write('\n');
    return written == payload.size() + 1;
}

bool TcpStatusListener::readLines(std::vector<std::string>& lines) {
    TaskLockGuard lock(mutex_);
    while (client_.available() > 0) {
        int c = client_.read();
        if (c < 0) break;

        if (c == '\n') {
            if (!overflowed_ && !partial_.empty()) {
                lines.push_back(partial_);
            }
            partial_.clear();
            overflowed_ = false;
        } else if (c == '\r') {
            continue;
        } else if (partial_.size() < MAX_LINE) {
            partial_ += static_cast<char>(c);
        } else {
            overflowed_ = true;
        }
    }
    return client_.connected();
}

void TcpStatusListener::close() {
    TaskLockGuard lock(mutex_);
    client_.stop();
}

std::string TcpStatusListener::remoteAddress() {
    TaskLockGuard lock(mutex_);
    return client_.remoteIP().toString().c_str();
}

bool StatusServer::start() {
    server_.begin();
    server_.setNoDelay(true);

    BaseType_t created = xTaskCreatePinnedToCore(taskFunction, "server", STACK_SIZE, this, PRIORITY, &handle_, CORE);
    if (created != pdPASS) {
        ESP_LOGE(TAG, "Failed to create server task");
        return false;
    }
    ESP_LOGI(TAG, "Listening on port %u (Core %d)", port_, CORE);
    return true;
}

void StatusServer::taskFunction(void* params) {
    static_cast<StatusServer*>(params)->run();
}

void StatusServer::run() {
    while (true) {
        acceptClients();
        serviceClients();
        vTaskDelay(pdMS_TO_TICKS(POLL_MS));
    }
}

void StatusServer::acceptClients() {
    WiFiClient client = server_.accept();
    if (!client) {
        return;
    }

    if (sessions_.size() >= MAX_CLIENTS) {
        ESP_LOGW(TAG, "Rejecting %s: %u clients already connected",
                 client.remoteIP().toString().c_str(), static_cast<unsigned>(sessions_.size()));
        client.stop();
        return;
    }

    client.setNoDelay(true);
    std::shared_ptr<TcpStatusListener> session = std::make_shared<TcpStatusListener>(client);
    if (!session->valid()) {
        ESP_LOGE(TAG, "No memory for session mutex, dropping %s", client.remoteIP().toString().c_str());
        client.stop();
        return;
    }

    if (!session->send(encodeStatus(broadcaster_.snapshot()))) {
        ESP_LOGW(TAG, "Client %s dropped before first status", session->remoteAddress().c_str());
        session->close();
        return;
    }

    sessions_.push_back(session);
    clients_.add(session);
    ESP_LOGI(TAG, "Client %s connected (%u total)",
             session->remoteAddress().c_str(), static_cast<unsigned>(sessions_.size()));
}

void StatusServer::serviceClients() {
    std::vector<std::string> lines;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        TcpStatusListener& session = **it;
        lines.clear();
        bool alive = session.readLines(lines);

        for (const std::string& line : lines) {
            handleLine(line, session);
        }

        if (alive) {
            ++it;
            continue;
        }

        ESP_LOGI(TAG, "Client %s disconnected", session.remoteAddress().c_str());
        clients_.remove(&session);
        session.close();
        it = sessions_.erase(it);
    }
}

void StatusServer::handleLine(const std::string& line, TcpStatusListener& from) {
    RemoteCommand cmd;
    std::string error;
    if (!decodeCommand(line, cmd, error)) {
        ESP_LOGW(TAG, "Dropped line from %s: %s", from.remoteAddress().c_str(), error.c_str());
        return;
    }

    if (!handler_.apply(cmd)) {
        ESP_LOGW(TAG, "Ignored command '%s'", cmd.name.c_str());
        return;
    }

    ESP_LOGI(TAG, "Applied %s", commandTypeName(cmd.type));
    broadcaster_.broadcast();
}
