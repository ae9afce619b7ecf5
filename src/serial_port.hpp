#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace repatcher {

// Blocking byte stream the frame reader pulls from.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Fill buf with exactly n bytes. Returns false on EOF, a short read or an
    // I/O error, with the cause in *err.
    virtual bool read_exact(uint8_t* buf, size_t n, std::string* err = nullptr) = 0;

    // Drop whatever the driver has buffered but not yet delivered.
    virtual void discard_input() = 0;
};

// Raw 8N1 serial device with blocking reads.
class SerialPort : public ByteSource {
public:
    // Returns nullptr (cause in *err) if the device cannot be opened or the
    // baud rate is not supported.
    static std::unique_ptr<SerialPort> open(const std::string& path, int baud,
                                            std::string* err = nullptr);

    ~SerialPort() override;
    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bool read_exact(uint8_t* buf, size_t n, std::string* err = nullptr) override;
    void discard_input() override;

    const std::string& path() const { return path_; }
    int baud() const { return baud_; }

private:
    SerialPort(std::string path, int baud, int fd);

    std::string path_;
    int baud_;
    int fd_;
};

// True for the rates SerialPort::open accepts.
bool is_supported_baud(int baud);

} // namespace repatcher
