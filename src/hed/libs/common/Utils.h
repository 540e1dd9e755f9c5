// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_UTILS_H__
#define __AEAT_UTILS_H__

#include <cerrno>
#include <string>

namespace Aeat {

  /** \addtogroup common
   *  @{ */

  /// Portable and thread-safe implementation of strerror.
  std::string StrError(int errnum = errno);

  /// Wrapper for pointer with automatic destruction
  /** If ordinary pointer is wrapped in instance of this class it will
     be automatically destroyed when instance is destroyed. This is
     useful for maintaining pointers in scope of one function. Only
     pointers returned by new() are supported unless a custom deletion
     function is passed, like X509_free for OpenSSL objects.
     \headerfile Utils.h aeat/Utils.h */
  template<typename T>
  class AutoPointer {
  private:
    T *object;
    void (*deleter)(T*);
    static void DefaultDeleter(T* o) { delete o; }
    void operator=(const AutoPointer<T>&);
    AutoPointer(AutoPointer<T> const&);
  public:
    /// NULL pointer constructor
    AutoPointer(void (*d)(T*) = &DefaultDeleter)
      : object(NULL), deleter(d) {}
    /// Constructor which wraps pointer and optionally defines deletion function
    AutoPointer(T *o, void (*d)(T*) = &DefaultDeleter)
      : object(o), deleter(d) {}
    /// Destructor destroys wrapped object using assigned deleter
    ~AutoPointer(void) {
      if (object) if(deleter) (*deleter)(object);
      object = NULL;
    }
    AutoPointer<T>& operator=(T* o) {
      if (object) if(deleter) (*deleter)(object);
      object = o;
      return *this;
    }
    /// For referring wrapped object
    T& operator*(void) const {
      return *object;
    }
    /// For referring wrapped object
    T* operator->(void) const {
      return object;
    }
    /// Returns false if pointer is NULL and true otherwise.
    operator bool(void) const {
      return (object != NULL);
    }
    /// Returns true if pointer is NULL and false otherwise.
    bool operator!(void) const {
      return (object == NULL);
    }
    /// Cast to original pointer
    T* Ptr(void) const {
      return object;
    }
    /// Release referred object so that it can be passed to other container
    T* Release(void) {
      T* tmp = object;
      object = NULL;
      return tmp;
    }
  };

  /** @} */

} // namespace Aeat

#endif // __AEAT_UTILS_H__
