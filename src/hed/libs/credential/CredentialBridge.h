#ifndef __AEAT_CREDENTIALBRIDGE_H__
#define __AEAT_CREDENTIALBRIDGE_H__

#include <list>
#include <string>

#include <glibmm/thread.h>

namespace Aeat {

  /** \addtogroup credential
   *  @{ */

  class Logger;
  class CredentialBridge;

  /// Client certificate container as supplied by user.
  /** Holds binary content of PKCS#12 (.p12/.pfx) file and its passphrase.
   * Passphrase is never logged.
   */
  class CredentialBundle {
   public:
    CredentialBundle(const std::string& pkcs12 = "", const std::string& passphrase = "")
      : pkcs12_(pkcs12), passphrase_(passphrase) {}
    /// Read container from file.
    /** Throws CertificateError if file can not be read. */
    static CredentialBundle Load(const std::string& path, const std::string& passphrase);
    const std::string& Data() const { return pkcs12_; }
    const std::string& Passphrase() const { return passphrase_; }
   private:
    std::string pkcs12_;
    std::string passphrase_;
  };

  /// Temporary PEM files holding unencrypted key and certificate.
  /** Files are created by CredentialBridge::Materialize() with owner-only
   * permissions and deleted by Release(). Release() is also called by
   * destructor, so keeping instance in scope of one operation guarantees
   * files are removed on every exit path. Instances can not be copied
   * and must not outlive CredentialBridge which filled them.
   */
  class EphemeralKeyMaterial {
    friend class CredentialBridge;
   public:
    EphemeralKeyMaterial();
    ~EphemeralKeyMaterial();
    /// Path to PEM file with certificate followed by chain certificates.
    const std::string& CertificateFile() const { return cert_file_; }
    /// Path to PEM file with unencrypted PKCS#8 private key.
    const std::string& KeyFile() const { return key_file_; }
    /// Delete both files if present.
    /** Can be called any number of times. Failures to delete are not
     * raised but recorded in ReleaseErrors(). */
    void Release();
    /// Messages of failed deletions.
    const std::list<std::string>& ReleaseErrors() const { return errors_; }
    /// True while files are held.
    operator bool() const { return !(cert_file_.empty() && key_file_.empty()); }
    bool operator!() const { return cert_file_.empty() && key_file_.empty(); }
   private:
    EphemeralKeyMaterial(const EphemeralKeyMaterial&);
    EphemeralKeyMaterial& operator=(const EphemeralKeyMaterial&);
    std::string cert_file_;
    std::string key_file_;
    std::list<std::string> errors_;
    CredentialBridge* bridge_;
  };

  /// Converts PKCS#12 container into files usable by TLS client.
  /** Each call of Materialize() creates new uniquely named files, hence
   * concurrent operations never share key material. Counters of
   * materializations and releases are kept for diagnostics.
   */
  class CredentialBridge {
    friend class EphemeralKeyMaterial;
   public:
    /// Files are created in tmpdir or in system temporary directory if empty.
    CredentialBridge(const std::string& tmpdir = "");
    ~CredentialBridge();

    /// Parse container and write key and certificate to temporary files.
    /** Throws CertificateError if container can not be parsed, passphrase
     * is rejected by integrity check, key or certificate is missing or
     * files can not be written. In the last case no file is left behind.
     * Files previously held by material are released first. */
    void Materialize(const std::string& pkcs12, const std::string& passphrase,
                     EphemeralKeyMaterial& material);

    /// Same as above for bundle.
    void Materialize(const CredentialBundle& bundle, EphemeralKeyMaterial& material) {
      Materialize(bundle.Data(), bundle.Passphrase(), material);
    }

    /// Explicit release of material, same as material.Release().
    void Release(EphemeralKeyMaterial& material) { material.Release(); }

    /// Delete files of all key material existing in this process.
    /** Only calls unlink(), hence it is safe to use in signal handler.
       Instances of EphemeralKeyMaterial are not updated. */
    static void RemoveAll();
    /// Delete key files when process is terminated by signal.
    /** Handlers are installed for SIGINT, SIGTERM, SIGHUP and SIGQUIT
       unless signal is ignored or already handled. Handler calls
       RemoveAll() and lets default action of signal terminate process.
       Returns false if any handler could not be installed. */
    static bool RemoveOnSignals();
    /// Number of successful Materialize() calls.
    int Materialized() const;
    /// Number of releases which removed materialized files.
    int Released() const;

   private:
    CredentialBridge(const CredentialBridge&);
    CredentialBridge& operator=(const CredentialBridge&);
    void Count(int& counter);
    std::string tmpdir_;
    int materialized_;
    int released_;
    mutable Glib::Mutex lock_;
    static Logger logger;
  };

  /** @} */

} // namespace Aeat

#endif /* __AEAT_CREDENTIALBRIDGE_H__ */
