#ifndef __AEAT_XMLNODE_H__
#define __AEAT_XMLNODE_H__

#include <string>
#include <list>
#include <map>

#include <libxml/xmlmemory.h>
#include <libxml/tree.h>
#include <libxml/parser.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

namespace Aeat {

  /** \addtogroup common
   *  @{ */

  class XMLNode;

  /// Class to represent an XML namespace.
  /** \headerfile XMLNode.h aeat/XMLNode.h */
  class NS
    : public std::map<std::string, std::string> {
  public:
    /// Constructor creates empty namespace
    NS(void) {}
    /// Constructor creates namespace with one entry
    NS(const char *prefix, const char *uri) {
      operator[](prefix) = uri;
    }
  };

  typedef std::list<XMLNode> XMLNodeList;

  /// Wrapper for LibXML library Tree interface.
  /** This class wraps XML Node, Document and Property/Attribute structures.
     Each instance serves as pointer to actual LibXML element and provides
     convenient (for chosen purpose) methods for manipulating it.
     It implements only small subset of XML capabilities, which is
     enough for handling SOAP messages and configuration documents.
     This class also filters out (usually) useless textual nodes which
     are often used to make XML documents human-readable.
     \headerfile XMLNode.h aeat/XMLNode.h */
  class XMLNode {
    friend bool MatchXMLName(const XMLNode& node, const char *name);
    friend bool MatchXMLName(const XMLNode& node, const std::string& name);
    friend bool MatchXMLNamespace(const XMLNode& node, const std::string& uri);

  protected:
    xmlNodePtr node_;
    /// True if XMLNode is owner of XML document.
    /** Normally that may be true only for top level node of XML document. */
    bool is_owner_;

    /// Private constructor for inherited classes
    /** Creates instance and links to existing LibXML structure. Acquired
       structure is not owned by class instance. */
    XMLNode(xmlNodePtr node)
      : node_(node),
        is_owner_(false) {}

  public:
    /// Constructor of invalid node
    /** Created instance does not point to XML element. All methods are
       still allowed for such instance but produce no results. */
    XMLNode(void)
      : node_(NULL),
        is_owner_(false) {}
    /// Copies existing instance.
    /** Underlying XML element is NOT copied. Ownership is NOT inherited. */
    XMLNode(const XMLNode& node)
      : node_(node.node_),
        is_owner_(false) {}
    /// Creates XML document structure from textual representation of XML document.
    /** Created structure is pointed and owned by constructed instance.
       If text is not well-formed XML the instance is invalid. */
    XMLNode(const std::string& xml);
    /// Same as previous
    XMLNode(const char *xml, int len = -1);
    /// Creates empty XML document structure with specified namespaces.
    /** Created XML contains only root element named 'name'.
       Created structure is pointed and owned by constructed instance */
    XMLNode(const NS& ns, const char *name);
    /// Destructor
    /** Also destroys underlying XML document if owned by this instance */
    ~XMLNode(void);
    /// Returns true if instance points to XML element - valid instance
    operator bool(void) const {
      return (node_ != NULL);
    }
    /// Returns true if instance does not point to XML element - invalid instance
    bool operator!(void) const {
      return (node_ == NULL);
    }
    /// Returns true if 'node' represents same XML element
    bool operator==(const XMLNode& node) const {
      return (node_ == node.node_);
    }
    /// Returns false if 'node' represents same XML element
    bool operator!=(const XMLNode& node) const {
      return (node_ != node.node_);
    }
    /// Returns XMLNode instance representing n-th child of XML element.
    /** If such does not exist invalid XMLNode instance is returned */
    XMLNode Child(int n = 0) const;
    /// Returns XMLNode instance representing first child element with specified name.
    /** Name may be "namespace_prefix:name", "namespace_uri:name" or simply
       "name". In last case namespace is ignored. If such node does not
       exist invalid XMLNode instance is returned */
    XMLNode operator[](const char *name) const;
    /// Similar to previous method
    XMLNode operator[](const std::string& name) const {
      return operator[](name.c_str());
    }
    /// Returns XMLNode instance representing n-th node in sequence of siblings of same name.
    /** It's main purpose is to be used to retrieve element in array of
       children of same name like node["name"][5]. */
    XMLNode operator[](int n) const;
    /// Convenience operator to switch to next element of same name.
    /** If there is no such node this object becomes invalid. */
    void operator++(void);
    /// Returns number of children nodes.
    int Size(void) const;
    /// Returns name of XML node.
    std::string Name(void) const;
    /// Returns namespace prefix of XML node.
    std::string Prefix(void) const;
    /// Returns prefix:name of XML node.
    std::string FullName(void) const {
      return Prefix() + ":" + Name();
    }
    /// Returns namespace URI of XML node.
    std::string Namespace(void) const;
    /// Assigns new name to XML node.
    /** Name may be prefixed with namespace prefix which is looked up
       among namespaces visible from this node. */
    void Name(const char *name);
    /// Assigns new name to XML node.
    void Name(const std::string& name) {
      Name(name.c_str());
    }
    /// Fills argument with this instance XML subtree textual representation.
    /** Namespaces referred in subtree but defined outside of it are
       added to the top element of produced text. */
    void GetXML(std::string& out_xml_str, bool user_friendly = false) const;
    /// Fills argument with textual representation of all children nodes.
    /** Unlike GetXML() of every child element, text, comments and
       processing instructions in between elements are included. */
    void GetContentXML(std::string& out_xml_str) const;
    /// Fills argument with whole XML document textual representation
    /** Output starts with XML declaration. */
    void GetDoc(std::string& out_xml_str, bool user_friendly = false) const;
    /// Returns textual content of node excluding content of children nodes.
    operator std::string(void) const;
    /// Sets textual content of node. All existing children nodes are discarded.
    XMLNode& operator=(const char *content);
    /// Sets textual content of node. All existing children nodes are discarded.
    XMLNode& operator=(const std::string& content) {
      return operator=(content.c_str());
    }
    /// Make instance refer to another XML node. Ownership is not inherited.
    /** Due to nature of XMLNode there should be no method for
       reassigning content of node. */
    XMLNode& operator=(const XMLNode& node);
    /// Declares namespaces at this element.
    /** Elements of this subtree which belong to any of these namespaces
       are switched to the prefix given here, so that processed XML can be
       referred to by known prefixes. Other declarations of same namespace
       inside subtree are removed unless new prefix is the default one. */
    void Namespaces(const NS& namespaces);
    /// Returns prefix of specified namespace or empty string if no such namespace.
    std::string NamespacePrefix(const char *urn) const;
    /// Creates new child XML element at specified position with specified name.
    /** Default is to put it at end of list. If global_order is true
       position applies to whole set of children, otherwise only to
       children of same name. Returns created node. */
    XMLNode NewChild(const char *name, int n = -1, bool global_order = false);
    /// Same as NewChild(const char*,int,bool)
    XMLNode NewChild(const std::string& name, int n = -1, bool global_order = false) {
      return NewChild(name.c_str(), n, global_order);
    }
    /// Creates new child XML element at specified position with specified name and namespaces.
    XMLNode NewChild(const char *name, const NS& namespaces, int n = -1, bool global_order = false);
    /// Same as NewChild(const char*,const NS&,int,bool)
    XMLNode NewChild(const std::string& name, const NS& namespaces, int n = -1, bool global_order = false) {
      return NewChild(name.c_str(), namespaces, n, global_order);
    }
    /// Parses textual XML fragment and appends resulting nodes as children.
    /** The fragment is parsed in context of this element, hence it may
       consist of several sibling elements and it may refer to namespaces
       defined at this element or above. Text in between elements is kept
       as is. Returns false and leaves this element untouched if fragment
       is not well-formed. */
    bool NewChildren(const std::string& xml);
    /// Destroys underlying XML element.
    /** XML element is unlinked from XML tree and destroyed.
       After this operation XMLNode instance becomes invalid */
    void Destroy(void);
    /// Uses XPath to look up the whole XML structure,
    /** Returns a list of XMLNode points. The xpathExpr should be like
       "//xx:child1/" which indicates the namespace and node that you
       would like to find. The nsList is the namespace the result should
       belong to (e.g. xx="uri:test"). Query is run on whole XML document
       but only the elements belonging to this XML subtree are returned. */
    XMLNodeList XPathLookup(const std::string& xpathExpr, const NS& nsList) const;
    /// Get the root node from any child node of the tree
    XMLNode GetRoot(void) const;
    /// Get the parent node from any child node of the tree
    XMLNode Parent(void) const;
  };

  /// Returns true if 'name' matches name of 'node'. If name contains prefix it's checked too
  bool MatchXMLName(const XMLNode& node, const char *name);

  /// Returns true if 'name' matches name of 'node'. If name contains prefix it's checked too
  bool MatchXMLName(const XMLNode& node, const std::string& name);

  /// Returns true if 'namespace' matches 'node's namespace.
  bool MatchXMLNamespace(const XMLNode& node, const std::string& uri);

  /** @} */

} // namespace Aeat

#endif /* __AEAT_XMLNODE_H__ */
