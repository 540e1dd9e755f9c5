// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_MOCKCONNECTION_H__
#define __AEAT_MOCKCONNECTION_H__

#include <list>
#include <string>

#include <sys/stat.h>

#include <aeat/communication/Connection.h>

// Connection replaying canned response in small pieces.
class MockConnection
  : public Aeat::Connection {
public:
  MockConnection(const std::string& response,
                 const Aeat::TransportStatus& end_status = Aeat::TransportStatus(),
                 std::string* sent = NULL,
                 const Aeat::TransportStatus& write_status = Aeat::TransportStatus())
    : closed(false), response_(response), pos_(0), end_status_(end_status),
      write_status_(write_status), sent_(sent) {}
  virtual Aeat::TransportStatus Write(const char* buf, int size) {
    if (!write_status_) return write_status_;
    written.append(buf, size);
    if (sent_) sent_->append(buf, size);
    return Aeat::TransportStatus(Aeat::STATUS_OK, "Mock");
  }
  virtual Aeat::TransportStatus Read(char* buf, int& size) {
    if (pos_ >= response_.length()) {
      size = 0;
      return end_status_;
    }
    // Small pieces exercise reassembly of lines and bodies
    std::string::size_type l = response_.length() - pos_;
    if (l > 7) l = 7;
    if ((int)l > size) l = size;
    response_.copy(buf, l, pos_);
    pos_ += l;
    size = l;
    return Aeat::TransportStatus(Aeat::STATUS_OK, "Mock");
  }
  virtual void Close() { closed = true; }
  std::string written;
  bool closed;
private:
  std::string response_;
  std::string::size_type pos_;
  Aeat::TransportStatus end_status_;
  Aeat::TransportStatus write_status_;
  std::string* sent_;
};

// Connector failing with queued statuses before handing out MockConnection.
class MockConnector
  : public Aeat::Connector {
public:
  MockConnector(const std::string& response = "",
                const Aeat::TransportStatus& end_status = Aeat::TransportStatus())
    : calls(0), connections(0), credentials_present(false),
      response(response), end_status(end_status) {}
  virtual Aeat::Connection* Connect(const Aeat::ConnectionConfig& cfg, Aeat::TransportStatus& status) {
    ++calls;
    config = cfg;
    struct stat st;
    credentials_present = (::stat(cfg.cert_file.c_str(), &st) == 0) &&
                          (::stat(cfg.key_file.c_str(), &st) == 0);
    if (!failures.empty()) {
      status = failures.front();
      failures.pop_front();
      return NULL;
    }
    ++connections;
    status = Aeat::TransportStatus(Aeat::STATUS_OK, "Mock");
    return new MockConnection(response, end_status, &sent);
  }
  void Fail(Aeat::TransportStatusKind kind, int times = 1) {
    for (int n = 0; n < times; ++n)
      failures.push_back(Aeat::TransportStatus(kind, "Mock", "Connection refused"));
  }
  int calls;
  int connections;
  bool credentials_present;
  Aeat::ConnectionConfig config;
  std::string sent;
  std::string response;
  Aeat::TransportStatus end_status;
  std::list<Aeat::TransportStatus> failures;
};

#endif // __AEAT_MOCKCONNECTION_H__
