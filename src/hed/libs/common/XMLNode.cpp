// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstring>

#include <libxml/xmlIO.h>

#include "XMLNode.h"

namespace Aeat {

  static const int parse_options = XML_PARSE_NODICT | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

  static bool IsElement(xmlNodePtr node) {
    return node && (node->type == XML_ELEMENT_NODE);
  }

  // Unqualified node belongs to namespace of nearest qualified ancestor
  static xmlNsPtr NodeNamespace(xmlNodePtr node) {
    for (; node; node = node->parent) {
      xmlNsPtr ns = NULL;
      if (node->type == XML_ELEMENT_NODE)
        ns = node->ns;
      else if (node->type == XML_ATTRIBUTE_NODE)
        ns = ((xmlAttrPtr)node)->ns;
      if (ns) return ns;
    }
    return NULL;
  }

  // Splits "prefix:name". Name without colon has empty prefix.
  static void SplitName(const char *qname, std::string& prefix, std::string& local) {
    const char *colon = strchr(qname, ':');
    if (colon) {
      prefix.assign(qname, colon - qname);
      local = colon + 1;
    } else {
      prefix.clear();
      local = qname;
    }
  }

  // Empty prefix stands for default namespace
  static xmlNsPtr FindPrefix(xmlNodePtr node, const std::string& prefix) {
    return xmlSearchNs(node->doc, node,
                       prefix.empty() ? NULL : (const xmlChar*)prefix.c_str());
  }

  static bool SameHref(xmlNsPtr ns1, xmlNsPtr ns2) {
    if (ns1 == ns2) return true;
    if (!ns1 || !ns2 || !ns1->href || !ns2->href) return false;
    return (xmlStrcmp(ns1->href, ns2->href) == 0);
  }

  static bool SameName(xmlNodePtr node1, xmlNodePtr node2) {
    if (!node1 || !node2) return false;
    if (node1->type != node2->type) return false;
    if (!node1->name || !node2->name) return false;
    if (xmlStrcmp(node1->name, node2->name) != 0) return false;
    return SameHref(NodeNamespace(node1), NodeNamespace(node2));
  }

  // Qualifier before last colon is either prefix or namespace URI
  static bool NameMatches(xmlNodePtr node, const char *name) {
    if (!node || !node->name || !name) return false;
    const char *local = strrchr(name, ':');
    local = local ? (local + 1) : name;
    if (strcmp(local, (const char*)node->name) != 0) return false;
    if (local == name) return true;
    std::string qualifier(name, local - name - 1);
    xmlNsPtr ns = NodeNamespace(node);
    if (!ns) return qualifier.empty();
    if (qualifier.find(':') != std::string::npos)
      return ns->href && (qualifier == (const char*)ns->href);
    if (!ns->prefix) return qualifier.empty();
    return (qualifier == (const char*)ns->prefix);
  }

  bool MatchXMLName(const XMLNode& node, const char *name) {
    return NameMatches(node.node_, name);
  }

  bool MatchXMLName(const XMLNode& node, const std::string& name) {
    return NameMatches(node.node_, name.c_str());
  }

  bool MatchXMLNamespace(const XMLNode& node, const std::string& uri) {
    if (!node.node_) return false;
    xmlNsPtr ns = NodeNamespace(node.node_);
    if (!ns || !ns->href) return uri.empty();
    return (uri == (const char*)ns->href);
  }

  // Moves every reference to namespace with same URI inside subtree to ns
  static void Rebind(xmlNodePtr node, xmlNsPtr ns) {
    if (!IsElement(node)) return;
    if (node->ns && SameHref(node->ns, ns)) node->ns = ns;
    // Attributes can not be in default namespace
    if (ns->prefix) {
      for (xmlAttrPtr attr = node->properties; attr; attr = attr->next) {
        if (attr->ns && SameHref(attr->ns, ns)) attr->ns = ns;
      }
    }
    for (xmlNodePtr child = node->children; child; child = child->next)
      Rebind(child, ns);
  }

  static void DropDeclarations(xmlNodePtr node, xmlNsPtr ns) {
    if (!IsElement(node)) return;
    xmlNsPtr *link = &(node->nsDef);
    while (*link) {
      xmlNsPtr def = *link;
      if ((def != ns) && SameHref(def, ns)) {
        *link = def->next;
        def->next = NULL;
        xmlFreeNs(def);
      } else {
        link = &(def->next);
      }
    }
    for (xmlNodePtr child = node->children; child; child = child->next)
      DropDeclarations(child, ns);
  }

  static void Declare(xmlNodePtr node, const NS& namespaces) {
    for (NS::const_iterator it = namespaces.begin(); it != namespaces.end(); ++it) {
      xmlNsPtr ns = xmlSearchNsByHref(node->doc, node, (const xmlChar*)it->second.c_str());
      if (ns && (it->first != (ns->prefix ? (const char*)ns->prefix : ""))) ns = NULL;
      if (!ns) {
        ns = xmlNewNs(node, (const xmlChar*)it->second.c_str(),
                      it->first.empty() ? NULL : (const xmlChar*)it->first.c_str());
        // Prefix is already bound to other namespace here
        if (!ns) continue;
      }
      Rebind(node, ns);
      if (ns->prefix) DropDeclarations(node, ns);
    }
  }

  static xmlNodePtr ParseDocument(const char *xml, int len) {
    xmlDocPtr doc = xmlReadMemory(xml, len, NULL, NULL, parse_options);
    if (!doc) return NULL;
    xmlNodePtr root = xmlDocGetRootElement(doc);
    if (!root) xmlFreeDoc(doc);
    return root;
  }

  XMLNode::XMLNode(const std::string& xml)
    : node_(ParseDocument(xml.c_str(), xml.length())),
      is_owner_(node_ != NULL) {}

  XMLNode::XMLNode(const char *xml, int len)
    : node_(NULL),
      is_owner_(false) {
    if (!xml) return;
    node_ = ParseDocument(xml, (len < 0) ? strlen(xml) : len);
    is_owner_ = (node_ != NULL);
  }

  XMLNode::XMLNode(const NS& ns, const char *name)
    : node_(NULL),
      is_owner_(false) {
    std::string prefix;
    std::string local;
    SplitName(name ? name : "", prefix, local);
    xmlDocPtr doc = xmlNewDoc((const xmlChar*)"1.0");
    if (!doc) return;
    xmlNodePtr root = xmlNewDocNode(doc, NULL, (const xmlChar*)local.c_str(), NULL);
    if (!root) {
      xmlFreeDoc(doc);
      return;
    }
    xmlDocSetRootElement(doc, root);
    Declare(root, ns);
    root->ns = FindPrefix(root, prefix);
    node_ = root;
    is_owner_ = true;
  }

  XMLNode::~XMLNode(void) {
    if (is_owner_ && node_)
      xmlFreeDoc(node_->doc);
  }

  XMLNode& XMLNode::operator=(const XMLNode& node) {
    if (this == &node) return *this;
    if (is_owner_ && node_ && node_->doc)
      xmlFreeDoc(node_->doc);
    node_ = node.node_;
    is_owner_ = false;
    return *this;
  }

  XMLNode XMLNode::Child(int n) const {
    if (!IsElement(node_) || (n < 0))
      return XMLNode();
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if (!IsElement(p)) continue;
      if (n-- == 0) return XMLNode(p);
    }
    return XMLNode();
  }

  XMLNode XMLNode::operator[](const char *name) const {
    if (!IsElement(node_))
      return XMLNode();
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if (IsElement(p) && NameMatches(p, name)) return XMLNode(p);
    }
    return XMLNode();
  }

  XMLNode XMLNode::operator[](int n) const {
    if (!node_ || (n < 0))
      return XMLNode();
    for (xmlNodePtr p = node_; p; p = p->next) {
      if (!SameName(node_, p)) continue;
      if (n-- == 0) return XMLNode(p);
    }
    return XMLNode();
  }

  void XMLNode::operator++(void) {
    if (!node_) return;
    if (is_owner_) {
      // Document element has no siblings
      xmlFreeDoc(node_->doc);
      node_ = NULL;
      is_owner_ = false;
      return;
    }
    xmlNodePtr p = node_->next;
    while (p && !SameName(node_, p)) p = p->next;
    node_ = p;
  }

  int XMLNode::Size(void) const {
    int n = 0;
    if (!IsElement(node_)) return n;
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if (IsElement(p)) ++n;
    }
    return n;
  }

  std::string XMLNode::Name(void) const {
    if (!node_ || !node_->name) return "";
    return (const char*)(node_->name);
  }

  std::string XMLNode::Prefix(void) const {
    xmlNsPtr ns = NodeNamespace(node_);
    if (!ns || !ns->prefix) return "";
    return (const char*)(ns->prefix);
  }

  std::string XMLNode::Namespace(void) const {
    xmlNsPtr ns = NodeNamespace(node_);
    if (!ns || !ns->href) return "";
    return (const char*)(ns->href);
  }

  void XMLNode::Name(const char *name) {
    if (!IsElement(node_) || !name) return;
    std::string prefix;
    std::string local;
    SplitName(name, prefix, local);
    node_->ns = FindPrefix(node_, prefix);
    xmlNodeSetName(node_, (const xmlChar*)local.c_str());
  }

  XMLNode::operator std::string(void) const {
    std::string content;
    if (!node_) return content;
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if ((p->type == XML_TEXT_NODE) || (p->type == XML_CDATA_SECTION_NODE)) {
        if (p->content) content += (const char*)(p->content);
      }
    }
    return content;
  }

  XMLNode& XMLNode::operator=(const char *content) {
    if (!IsElement(node_)) return *this;
    xmlNodePtr child = node_->children;
    while (child) {
      xmlNodePtr next = child->next;
      xmlUnlinkNode(child);
      xmlFreeNode(child);
      child = next;
    }
    // Text node is escaped when serialized
    xmlNodePtr text = xmlNewDocText(node_->doc, (const xmlChar*)(content ? content : ""));
    if (text) xmlAddChild(node_, text);
    return *this;
  }

  void XMLNode::Namespaces(const NS& namespaces) {
    if (!IsElement(node_)) return;
    Declare(node_, namespaces);
  }

  std::string XMLNode::NamespacePrefix(const char *urn) const {
    if (!node_ || !urn) return "";
    xmlNsPtr ns = xmlSearchNsByHref(node_->doc, node_, (const xmlChar*)urn);
    if (!ns || !ns->prefix) return "";
    return (const char*)(ns->prefix);
  }

  XMLNode XMLNode::NewChild(const char *name, int n, bool global_order) {
    if (!IsElement(node_) || !name) return XMLNode();
    std::string prefix;
    std::string local;
    SplitName(name, prefix, local);
    xmlNodePtr child = xmlNewDocNode(node_->doc, FindPrefix(node_, prefix),
                                     (const xmlChar*)local.c_str(), NULL);
    if (!child) return XMLNode();
    XMLNode before;
    if (n >= 0) before = global_order ? Child(n) : operator[](name)[n];
    if (before) return XMLNode(xmlAddPrevSibling(before.node_, child));
    return XMLNode(xmlAddChild(node_, child));
  }

  XMLNode XMLNode::NewChild(const char *name, const NS& namespaces, int n, bool global_order) {
    XMLNode child = NewChild(name, n, global_order);
    if (!child) return child;
    child.Namespaces(namespaces);
    // Prefix may refer to namespace declared just now
    child.Name(name);
    return child;
  }

  bool XMLNode::NewChildren(const std::string& xml) {
    if (!IsElement(node_) || !node_->doc)
      return false;
    if (xml.empty())
      return true;
    xmlNodePtr lst = NULL;
    xmlParserErrors err = xmlParseInNodeContext(node_, xml.c_str(), xml.length(),
                                                parse_options, &lst);
    if (err != XML_ERR_OK) {
      if (lst) xmlFreeNodeList(lst);
      return false;
    }
    if (lst) xmlAddChildList(node_, lst);
    return true;
  }

  void XMLNode::Destroy(void) {
    if (!node_) return;
    if (is_owner_) {
      xmlFreeDoc(node_->doc);
      node_ = NULL;
      is_owner_ = false;
      return;
    }
    if (!IsElement(node_)) return;
    // Indentation in front of element goes away with it
    xmlNodePtr indent = node_->prev;
    if (indent && xmlIsBlankNode(indent)) {
      xmlUnlinkNode(indent);
      xmlFreeNode(indent);
    }
    xmlUnlinkNode(node_);
    xmlFreeNode(node_);
    node_ = NULL;
  }

  static bool Contains(xmlNodePtr top, xmlNodePtr node) {
    for (; node; node = node->parent) {
      if (node == top) return true;
    }
    return false;
  }

  XMLNodeList XMLNode::XPathLookup(const std::string& xpathExpr, const NS& nsList) const {
    XMLNodeList found;
    if (!IsElement(node_) || !node_->doc) return found;
    xmlXPathContextPtr ctx = xmlXPathNewContext(node_->doc);
    if (!ctx) return found;
    for (NS::const_iterator ns = nsList.begin(); ns != nsList.end(); ++ns) {
      // XPath 1.0 has no default namespace
      if (ns->first.empty()) continue;
      xmlXPathRegisterNs(ctx, (const xmlChar*)ns->first.c_str(), (const xmlChar*)ns->second.c_str());
    }
    xmlXPathObjectPtr result = xmlXPathEvalExpression((const xmlChar*)xpathExpr.c_str(), ctx);
    if (result) {
      int size = xmlXPathNodeSetGetLength(result->nodesetval);
      for (int i = 0; i < size; ++i) {
        xmlNodePtr node = xmlXPathNodeSetItem(result->nodesetval, i);
        if (IsElement(node) && Contains(node_, node)) found.push_back(XMLNode(node));
      }
      xmlXPathFreeObject(result);
    }
    xmlXPathFreeContext(ctx);
    return found;
  }

  XMLNode XMLNode::GetRoot(void) const {
    if (!node_ || !node_->doc) return XMLNode();
    return XMLNode(xmlDocGetRootElement(node_->doc));
  }

  XMLNode XMLNode::Parent(void) const {
    if (!node_) return XMLNode();
    if (node_->type == XML_ATTRIBUTE_NODE)
      return XMLNode(node_->parent);
    if (IsElement(node_) && IsElement(node_->parent))
      return XMLNode(node_->parent);
    return XMLNode();
  }

  void XMLNode::GetDoc(std::string& out_xml_str, bool user_friendly) const {
    out_xml_str.clear();
    if (!node_ || !node_->doc) return;
    xmlDocPtr doc = node_->doc;
    xmlChar *buf = NULL;
    int len = 0;
    xmlDocDumpFormatMemoryEnc(doc, &buf, &len, (const char*)(doc->encoding), user_friendly ? 1 : 0);
    if (!buf) return;
    out_xml_str.assign((const char*)buf, len);
    xmlFree(buf);
  }

  void XMLNode::GetXML(std::string& out_xml_str, bool user_friendly) const {
    out_xml_str.clear();
    if (!IsElement(node_) || !node_->doc) return;
    xmlDocPtr scratch = NULL;
    xmlNodePtr node = node_;
    if (node_ != xmlDocGetRootElement(node_->doc)) {
      // Copy gets declarations of namespaces defined above this element
      scratch = xmlNewDoc((const xmlChar*)"1.0");
      if (!scratch) return;
      node = xmlDocCopyNode(node_, scratch, 1);
      if (!node) {
        xmlFreeDoc(scratch);
        return;
      }
      xmlDocSetRootElement(scratch, node);
    }
    xmlOutputBufferPtr buf = xmlAllocOutputBuffer(NULL);
    if (buf) {
      xmlNodeDumpOutput(buf, node->doc, node, 0, user_friendly ? 1 : 0, "UTF-8");
      xmlOutputBufferFlush(buf);
      const xmlChar *content = xmlOutputBufferGetContent(buf);
      if (content) out_xml_str.assign((const char*)content, xmlOutputBufferGetSize(buf));
      xmlOutputBufferClose(buf);
    }
    if (scratch) xmlFreeDoc(scratch);
  }

  void XMLNode::GetContentXML(std::string& out_xml_str) const {
    out_xml_str.clear();
    if (!IsElement(node_) || !node_->doc) return;
    for (xmlNodePtr p = node_->children; p; p = p->next) {
      if (IsElement(p)) {
        std::string xml;
        XMLNode(p).GetXML(xml);
        out_xml_str += xml;
        continue;
      }
      xmlOutputBufferPtr buf = xmlAllocOutputBuffer(NULL);
      if (!buf) continue;
      xmlNodeDumpOutput(buf, node_->doc, p, 0, 0, "UTF-8");
      xmlOutputBufferFlush(buf);
      const xmlChar *content = xmlOutputBufferGetContent(buf);
      if (content) out_xml_str.append((const char*)content, xmlOutputBufferGetSize(buf));
      xmlOutputBufferClose(buf);
    }
  }

} // namespace Aeat
