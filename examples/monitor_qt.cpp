#include <iostream>
#include <QApplication>
#include <QWidget>
#include <QPushButton>
#include <QLabel>
#include <QLineEdit>
#include <QTextEdit>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QScrollBar>
#include <QTimer>
#include <QDateTime>
#include <QStringList>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <memory>
#include <set>

#include "core/gateway.hpp"
#include "common/helpers.hpp"

class BusMonitor : public QWidget
{
    Q_OBJECT

public:
    explicit BusMonitor(const buspro::GatewayConfig& config) : gateway_(config)
    {
        setWindowTitle("Buspro Monitor");
        resize(640, 600);

        auto* layout = new QVBoxLayout(this);

        status_label_ = new QLabel("Status: Not started");
        status_label_->setStyleSheet("font-weight: bold;");
        layout->addWidget(status_label_);

        devices_label_ = new QLabel("Devices: -");
        layout->addWidget(devices_label_);

        auto* btn_layout = new QHBoxLayout();
        btn_discover_ = new QPushButton("Discover");
        connect(btn_discover_, &QPushButton::clicked, this, &BusMonitor::discover);
        btn_layout->addWidget(btn_discover_);
        auto* btn_poll = new QPushButton("Poll");
        connect(btn_poll, &QPushButton::clicked, this, &BusMonitor::poll);
        btn_layout->addWidget(btn_poll);
        layout->addLayout(btn_layout);

        auto* send_layout = new QHBoxLayout();
        address_edit_ = new QLineEdit();
        address_edit_->setPlaceholderText("subnet.device");
        send_layout->addWidget(address_edit_);
        code_edit_ = new QLineEdit();
        code_edit_->setPlaceholderText("0x0033");
        send_layout->addWidget(code_edit_);
        payload_edit_ = new QLineEdit();
        payload_edit_->setPlaceholderText("payload bytes, e.g. 01 64 00 00");
        send_layout->addWidget(payload_edit_);
        auto* btn_send = new QPushButton("Send");
        connect(btn_send, &QPushButton::clicked, this, &BusMonitor::send);
        send_layout->addWidget(btn_send);
        layout->addLayout(send_layout);

        layout->addWidget(new QLabel("Log:"));
        log_text_ = new QTextEdit();
        log_text_->setReadOnly(true);
        log_text_->setStyleSheet("font-family: monospace; font-size: 11px;");
        layout->addWidget(log_text_);

        auto* btn_clear = new QPushButton("Clear Log");
        connect(btn_clear, &QPushButton::clicked, log_text_, &QTextEdit::clear);
        layout->addWidget(btn_clear);

        message_timer_ = new QTimer(this);
        connect(message_timer_, &QTimer::timeout, this, &BusMonitor::processMessages);
        message_timer_->start(50);

        // Library threads only queue text; the timer moves it into the widgets
        gateway_.logger().set_log_callback([this](buspro::LogLevel level, const std::string& msg) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push(QString("[%1] %2").arg(QString::fromLatin1(buspro::level_to_string(level)), QString::fromStdString(msg)));
        });
        gateway_.subscribe_telegrams([this](const buspro::Telegram& t) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            log_queue_.push("[BUS] " + QString::fromStdString(buspro::to_string(t)));
        });

        auto started = gateway_.start();
        if (started.ok()) {
            status_label_->setText(QString("Status: Listening on port %1").arg(gateway_.local_port()));
        } else {
            status_label_->setText(QString("Status: %1").arg(QString::fromLatin1(buspro::error_to_string(started.error()))));
        }
    }

    ~BusMonitor()
    {
        gateway_.stop();
        if (discover_thread_.joinable()) {
            discover_thread_.join();
        }
    }

private slots:
    void processMessages()
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        while (!log_queue_.empty()) {
            logMsg(log_queue_.front());
            log_queue_.pop();
        }
        if (discover_done_flag_) {
            discover_done_flag_ = false;
            if (discover_thread_.joinable()) {
                discover_thread_.join();
            }
            btn_discover_->setEnabled(true);
            showDevices();
        }
    }

    void discover()
    {
        if (discovering_.load()) return;

        logMsg("[DISCOVERY] Scanning...");
        btn_discover_->setEnabled(false);
        discovering_.store(true);
        discover_thread_ = std::thread([this]() {
            gateway_.discover();
            discovering_.store(false);
            discover_done_flag_ = true;
        });
    }

    void poll()
    {
        logMsg("[POLL] Polling subscribed channels...");
        QApplication::processEvents();
        int refreshed = gateway_.poll_now();
        logMsg(QString("[POLL] %1 channel(s) refreshed").arg(refreshed));
    }

    void send()
    {
        QStringList address = address_edit_->text().split('.');
        bool ok_s = false, ok_d = false, ok_c = false;
        if (address.size() != 2) {
            logMsg("[SEND] Address must be subnet.device");
            return;
        }
        uint subnet = address[0].toUInt(&ok_s);
        uint device = address[1].toUInt(&ok_d);
        uint code = code_edit_->text().toUInt(&ok_c, 0);
        if (!ok_s || !ok_d || !ok_c || subnet > 255 || device > 255 || code > 0xFFFF) {
            logMsg("[SEND] Bad address or operate code");
            return;
        }

        std::vector<uint8_t> payload;
        for (const QString& part : payload_edit_->text().split(' ', Qt::SkipEmptyParts)) {
            bool ok = false;
            uint value = part.toUInt(&ok, 16);
            if (!ok || value > 255) {
                logMsg("[SEND] Bad payload byte: " + part);
                return;
            }
            payload.push_back(static_cast<uint8_t>(value));
        }

        QApplication::processEvents();
        auto reply = gateway_.send_message(static_cast<uint8_t>(subnet), static_cast<uint8_t>(device),
                                           static_cast<uint16_t>(code), payload);
        if (reply.ok()) {
            logMsg("[SEND] Reply: " + QString::fromStdString(buspro::bytesToHex(reply.value())));
        } else {
            logMsg(QString("[SEND] FAILED: %1").arg(QString::fromLatin1(buspro::error_to_string(reply.error()))));
        }
    }

private:
    void showDevices()
    {
        auto devices = gateway_.devices();
        QStringList parts;
        for (const auto& [category, list] : devices) {
            parts << QString("%1 %2").arg(QString::fromLatin1(buspro::category_to_string(category))).arg(list.size());
            for (const auto& d : list) {
                for (uint8_t channel : d.channels) {
                    if (!watched_.insert(buspro::DeviceKey{d.subnet, d.device, channel}).second) continue;
                    gateway_.register_callback(d.subnet, d.device, channel,
                        [this](const buspro::StatusUpdate& u) {
                            std::lock_guard<std::mutex> lock(queue_mutex_);
                            log_queue_.push("[STATUS] " + QString::fromStdString(buspro::to_string(u.key)));
                        },
                        d.category);
                }
            }
        }
        devices_label_->setText("Devices: " + (parts.isEmpty() ? QString("none") : parts.join(", ")));
    }

    void logMsg(const QString& msg)
    {
        QString ts = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        log_text_->append(QString("[%1] %2").arg(ts, msg));
        QScrollBar* sb = log_text_->verticalScrollBar();
        sb->setValue(sb->maximum());
    }

    buspro::Gateway gateway_;
    std::set<buspro::DeviceKey> watched_;

    std::thread discover_thread_;
    std::atomic<bool> discovering_{false};
    std::atomic<bool> discover_done_flag_{false};

    std::mutex queue_mutex_;
    std::queue<QString> log_queue_;
    QTimer* message_timer_;

    QLabel* status_label_;
    QLabel* devices_label_;
    QLineEdit* address_edit_;
    QLineEdit* code_edit_;
    QLineEdit* payload_edit_;
    QTextEdit* log_text_;
    QPushButton* btn_discover_;
};

#include "monitor_qt.moc"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);

    const char* path = argc > 1 ? argv[1] : "buspro.conf";
    std::string bad_line;
    auto config = buspro::load_config(path, &bad_line);
    if (!config.ok()) {
        std::cerr << "Config error in " << path << ": " << bad_line << "\n";
        return 1;
    }

    BusMonitor monitor(config.value());
    monitor.show();
    return app.exec();
}
