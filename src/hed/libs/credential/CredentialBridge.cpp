#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cerrno>
#include <climits>
#include <cstring>

#include <signal.h>
#include <unistd.h>

#include <glibmm/miscutils.h>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>

#include <aeat/FileUtils.h>
#include <aeat/Logger.h>
#include <aeat/SenderError.h>
#include <aeat/Utils.h>

#include "CredentialBridge.h"

namespace Aeat {

  Logger CredentialBridge::logger(Logger::getRootLogger(), "CredentialBridge");

  static int ssl_err_cb(const char *str, size_t, void *u) {
    Logger& logger = *((Logger*)u);
    logger.msg(DEBUG, "OpenSSL error string: %s", str);
    return 1;
  }

  // Logs all queued OpenSSL errors and returns reason of last one.
  static std::string LogSSLError(Logger& logger) {
    std::string reason;
    unsigned long err = ERR_peek_last_error();
    if (err != 0) {
      const char* r = ERR_reason_error_string(err);
      if (r) reason = r;
    }
    ERR_print_errors_cb(&ssl_err_cb, &logger);
    return reason;
  }

  static void x509_stack_free(STACK_OF(X509)* certs) {
    sk_X509_pop_free(certs, X509_free);
  }

  static bool bio_to_string(BIO* bio, std::string& str) {
    char* data = NULL;
    long len = BIO_get_mem_data(bio, &data);
    if ((len < 0) || (data == NULL)) return false;
    str.assign(data, len);
    return true;
  }

  // Paths of existing PEM files. Kept in fixed buffers so that signal
  // handler can remove them without allocating or locking.
  static const int registry_size = 32;
  static char registry_path[registry_size][PATH_MAX];
  static volatile sig_atomic_t registry_used[registry_size];
  static Glib::Mutex registry_lock;

  static bool RegisterFile(const std::string& path) {
    if (path.length() >= PATH_MAX) return false;
    Glib::Mutex::Lock lock(registry_lock);
    for (int n = 0; n < registry_size; ++n) {
      if (registry_used[n]) continue;
      memcpy(registry_path[n], path.c_str(), path.length() + 1);
      registry_used[n] = 1;
      return true;
    }
    return false;
  }

  static void UnregisterFile(const std::string& path) {
    Glib::Mutex::Lock lock(registry_lock);
    for (int n = 0; n < registry_size; ++n) {
      if (registry_used[n] && (path == registry_path[n])) {
        registry_used[n] = 0;
        return;
      }
    }
  }

  static const int cleanup_signals[] = { SIGINT, SIGTERM, SIGHUP, SIGQUIT, 0 };

  static void RemoveOnSignalHandler(int sig) {
    CredentialBridge::RemoveAll();
    // Handler was reset to default, signal is delivered on return
    raise(sig);
  }

  CredentialBundle CredentialBundle::Load(const std::string& path, const std::string& passphrase) {
    std::string content;
    if (!FileRead(path, content)) {
      throw CertificateError(IString("Certificate file %s can not be read: %s",
                                     path, StrError(errno)).str());
    }
    return CredentialBundle(content, passphrase);
  }

  EphemeralKeyMaterial::EphemeralKeyMaterial()
    : bridge_(NULL) {}

  EphemeralKeyMaterial::~EphemeralKeyMaterial() {
    Release();
  }

  void EphemeralKeyMaterial::Release() {
    if (!(*this)) return;
    std::string* files[] = { &key_file_, &cert_file_ };
    for (int n = 0; n < 2; ++n) {
      std::string& file = *(files[n]);
      if (file.empty()) continue;
      if (!FileDelete(file) && (errno != ENOENT)) {
        errors_.push_back(IString("Failed to delete temporary file %s: %s",
                                  file, StrError(errno)).str());
      }
      UnregisterFile(file);
      file.clear();
    }
    if (bridge_) {
      bridge_->Count(bridge_->released_);
      bridge_->logger.msg(DEBUG, "Temporary PEM files released");
    }
    bridge_ = NULL;
  }

  CredentialBridge::CredentialBridge(const std::string& tmpdir)
    : tmpdir_(tmpdir),
      materialized_(0),
      released_(0) {
    if (tmpdir_.empty()) tmpdir_ = Glib::get_tmp_dir();
  }

  CredentialBridge::~CredentialBridge() {
  }

  void CredentialBridge::RemoveAll() {
    for (int n = 0; n < registry_size; ++n) {
      if (registry_used[n]) ::unlink(registry_path[n]);
    }
  }

  bool CredentialBridge::RemoveOnSignals() {
    bool result = true;
    for (int n = 0; cleanup_signals[n]; ++n) {
      struct sigaction current;
      if (sigaction(cleanup_signals[n], NULL, &current) != 0) {
        result = false;
        continue;
      }
      // Ignored signals and handlers of application stay as they are
      if (current.sa_handler != SIG_DFL) continue;
      struct sigaction action;
      memset(&action, 0, sizeof(action));
      action.sa_handler = &RemoveOnSignalHandler;
      sigemptyset(&action.sa_mask);
      for (int m = 0; cleanup_signals[m]; ++m) sigaddset(&action.sa_mask, cleanup_signals[m]);
      action.sa_flags = SA_RESETHAND;
      if (sigaction(cleanup_signals[n], &action, NULL) != 0) {
        logger.msg(WARNING, "Failed to install handler of signal %d: %s", cleanup_signals[n], StrError(errno));
        result = false;
      }
    }
    return result;
  }

  void CredentialBridge::Count(int& counter) {
    Glib::Mutex::Lock lock(lock_);
    ++counter;
  }

  int CredentialBridge::Materialized() const {
    Glib::Mutex::Lock lock(lock_);
    return materialized_;
  }

  int CredentialBridge::Released() const {
    Glib::Mutex::Lock lock(lock_);
    return released_;
  }

  void CredentialBridge::Materialize(const std::string& pkcs12, const std::string& passphrase,
                                     EphemeralKeyMaterial& material) {
    material.Release();
    ERR_clear_error();

    const unsigned char* p12_data = (const unsigned char*)pkcs12.c_str();
    AutoPointer<PKCS12> p12(d2i_PKCS12(NULL, &p12_data, pkcs12.length()), &PKCS12_free);
    if (!p12) {
      std::string reason = LogSSLError(logger);
      logger.msg(ERROR, "Can not parse PKCS#12 container");
      throw CertificateError("Can not parse PKCS#12 container" + (reason.empty() ? std::string() : (": " + reason)));
    }
    // Integrity check tells wrong passphrase apart from broken content
    const char* pass = passphrase.empty() ? NULL : passphrase.c_str();
    if (PKCS12_mac_present(p12.Ptr())) {
      bool mac_ok = (PKCS12_verify_mac(p12.Ptr(), pass, -1) == 1);
      if (!mac_ok && !pass) mac_ok = (PKCS12_verify_mac(p12.Ptr(), "", 0) == 1);
      if (!mac_ok) {
        LogSSLError(logger);
        logger.msg(ERROR, "PKCS#12 integrity check failed, passphrase is wrong");
        throw CertificateError("PKCS#12 integrity check failed: wrong passphrase");
      }
    }

    EVP_PKEY* pkey_ = NULL;
    X509* cert_ = NULL;
    STACK_OF(X509)* ca_ = NULL;
    if (!PKCS12_parse(p12.Ptr(), pass, &pkey_, &cert_, &ca_)) {
      std::string reason = LogSSLError(logger);
      logger.msg(ERROR, "Can not parse PKCS#12 container");
      throw CertificateError("Can not extract key and certificate from PKCS#12 container" +
                             (reason.empty() ? std::string() : (": " + reason)));
    }
    AutoPointer<EVP_PKEY> pkey(pkey_, &EVP_PKEY_free);
    AutoPointer<X509> cert(cert_, &X509_free);
    AutoPointer<STACK_OF(X509)> ca(ca_, &x509_stack_free);
    if (!pkey || !cert) {
      logger.msg(ERROR, "PKCS#12 container does not contain private key and certificate");
      throw CertificateError("PKCS#12 container does not contain private key and certificate");
    }

    std::string cert_pem;
    std::string key_pem;
    {
      AutoPointer<BIO> bio(BIO_new(BIO_s_mem()), &BIO_free_all);
      if (!bio || !PEM_write_bio_X509(bio.Ptr(), cert.Ptr())) {
        LogSSLError(logger);
        throw CertificateError("Failed to convert certificate to PEM");
      }
      // Chain certificates follow end entity certificate
      for (int n = 0; ca && (n < sk_X509_num(ca.Ptr())); ++n) {
        if (!PEM_write_bio_X509(bio.Ptr(), sk_X509_value(ca.Ptr(), n))) {
          LogSSLError(logger);
          throw CertificateError("Failed to convert chain certificate to PEM");
        }
      }
      if (!bio_to_string(bio.Ptr(), cert_pem))
        throw CertificateError("Failed to convert certificate to PEM");
    }
    {
      AutoPointer<BIO> bio(BIO_new(BIO_s_mem()), &BIO_free_all);
      if (!bio || !PEM_write_bio_PKCS8PrivateKey(bio.Ptr(), pkey.Ptr(), NULL, NULL, 0, NULL, NULL)) {
        LogSSLError(logger);
        throw CertificateError("Failed to convert private key to PEM");
      }
      if (!bio_to_string(bio.Ptr(), key_pem))
        throw CertificateError("Failed to convert private key to PEM");
      // BIO_free_all does not clear memory holding unencrypted key
      char* data = NULL;
      long len = BIO_get_mem_data(bio.Ptr(), &data);
      if (data && (len > 0)) OPENSSL_cleanse(data, len);
    }

    std::string cert_file = Glib::build_filename(tmpdir_, "aeat-cert-XXXXXX");
    std::string key_file = Glib::build_filename(tmpdir_, "aeat-key-XXXXXX");
    if ((cert_file.length() >= PATH_MAX) || (key_file.length() >= PATH_MAX)) {
      OPENSSL_cleanse(&key_pem[0], key_pem.length());
      logger.msg(ERROR, "Temporary directory path is too long: %s", tmpdir_);
      throw CertificateError("Temporary directory path is too long: " + tmpdir_);
    }
    if (!TmpFileCreate(cert_file, cert_pem, S_IRUSR|S_IWUSR)) {
      std::string err = StrError(errno);
      OPENSSL_cleanse(&key_pem[0], key_pem.length());
      logger.msg(ERROR, "Failed to create temporary certificate file in %s: %s", tmpdir_, err);
      throw CertificateError("Failed to create temporary certificate file: " + err);
    }
    if (!RegisterFile(cert_file)) {
      logger.msg(VERBOSE, "Too many key files at once, %s is not removed on signals", cert_file);
    }
    bool key_ok = TmpFileCreate(key_file, key_pem, S_IRUSR|S_IWUSR);
    int key_errno = errno;
    OPENSSL_cleanse(&key_pem[0], key_pem.length());
    if (!key_ok) {
      std::string err = StrError(key_errno);
      if (!FileDelete(cert_file)) {
        logger.msg(WARNING, "Failed to delete temporary file %s: %s", cert_file, StrError(errno));
      }
      UnregisterFile(cert_file);
      logger.msg(ERROR, "Failed to create temporary key file in %s: %s", tmpdir_, err);
      throw CertificateError("Failed to create temporary key file: " + err);
    }

    if (!RegisterFile(key_file)) {
      logger.msg(VERBOSE, "Too many key files at once, %s is not removed on signals", key_file);
    }

    material.cert_file_ = cert_file;
    material.key_file_ = key_file;
    material.errors_.clear();
    material.bridge_ = this;
    Count(materialized_);
    logger.msg(DEBUG, "Certificate converted to PEM: cert=%s, key=%s", cert_file, key_file);
  }

} // namespace Aeat
