/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2008-2012 Free Software Foundation Europe e.V.
   Copyright (C) 2011-2016 Planets Communications B.V.
   Copyright (C) 2013-2026 Bareos GmbH & Co. KG

   This program is Free Software; you can redistribute it and/or
   modify it under the terms of version three of the GNU Affero General Public
   License as published by the Free Software Foundation and included
   in the file LICENSE.

   This program is distributed in the hope that it will be useful, but
   WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
   Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program; if not, write to the Free Software
   Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
   02110-1301, USA.
*/
/**
 * @file
 * Functions to handle Extended Attributes.
 *
 * Extended Attributes are so OS specific we only restore Extended Attributes if
 * they were saved on the same platform.
 *
 * Currently we support the following OSes:
 *   - Darwin (Extended Attributes)
 *   - FreeBSD (Extended Attributes, user namespace)
 *   - Linux (Extended Attributes)
 */

#include "include/metakeep.h"
#include "findlib/xattr.h"
#include "lib/berrno.h"

#if defined(HAVE_XATTR) && defined(HAVE_SYS_XATTR_H)
#  include <sys/xattr.h>
#elif defined(HAVE_EXTATTR)
#  include <sys/extattr.h>
#endif

namespace metakeep {

void XattrState::ChangeDevice(uint64_t dev)
{
  /* See if we are changing from one device to another.
   * We save the current device we are scanning and compare
   * it with the device of the entry we are currently handling. */
  if (first_dev || current_dev != dev) {
    flags = BXATTR_FLAG_SAVE_NATIVE | BXATTR_FLAG_RESTORE_NATIVE;
    first_dev = false;
    current_dev = dev;
  }
}

// Virtual attributes the filesystem generates itself, never saved.
#if defined(HAVE_DARWIN_OS)
static const char* xattr_skiplist[]
    = {"com.apple.system.extendedsecurity", "com.apple.ResourceFork", NULL};
#elif defined(HAVE_LINUX_OS)
static const char* xattr_skiplist[]
    = {"ceph.dir.entries",  "ceph.dir.files",    "ceph.dir.rbytes",
       "ceph.dir.rctime",   "ceph.dir.rentries", "ceph.dir.rfiles",
       "ceph.dir.rsubdirs", "ceph.dir.subdirs",  NULL};
#else
static const char* xattr_skiplist[1] = {NULL};
#endif

bool XattrNameIsSkipped(const std::string& name)
{
  if (name.empty()) { return true; }
  for (int cnt = 0; xattr_skiplist[cnt] != NULL; cnt++) {
    if (name == xattr_skiplist[cnt]) { return true; }
  }
  return false;
}

#if defined(HAVE_XATTR) && defined(HAVE_SYS_XATTR_H)

/**
 * OSX doesn't have llistxattr, lgetxattr and lsetxattr but has
 * listxattr, getxattr and setxattr with an extra options argument
 * which mimics the l variants of the functions when we specify
 * XATTR_NOFOLLOW as the options value.
 */
#  if defined(HAVE_DARWIN_OS)
#    define llistxattr(path, list, size) \
      listxattr((path), (list), (size), XATTR_NOFOLLOW)
#    define lgetxattr(path, name, value, size) \
      getxattr((path), (name), (value), (size), 0, XATTR_NOFOLLOW)
#    define lsetxattr(path, name, value, size, flags) \
      setxattr((path), (name), (value), (size), (flags), XATTR_NOFOLLOW)
#  endif

class SystemXattr : public XattrOps {
 public:
  OsResult List(const std::string& path,
                std::vector<std::string>& names) override
  {
    std::vector<char> list;
    ssize_t list_len;

    names.clear();
    while (1) {
      // First get the length of the available list with extended attributes.
      list_len = llistxattr(path.c_str(), NULL, 0);
      if (list_len < 0) { return OsResultFromErrno(errno); }
      if (list_len == 0) { return OsResult::Ok(); }

      list.assign(list_len + 1, 0);
      list_len = llistxattr(path.c_str(), list.data(), list_len);
      if (list_len < 0) {
        // the list grew in between, try again
        if (errno == ERANGE) { continue; }
        return OsResultFromErrno(errno);
      }
      break;
    }
    list[list_len] = '\0';

    for (const char* bp = list.data(); bp < list.data() + list_len;
         bp = strchr(bp, '\0') + 1) {
      names.emplace_back(bp);
    }
    return OsResult::Ok();
  }

  OsResult Get(const std::string& path,
               const std::string& name,
               std::vector<char>& value) override
  {
    ssize_t value_len;

    value.clear();
    while (1) {
      // First see how long the value is for the extended attribute.
      value_len = lgetxattr(path.c_str(), name.c_str(), NULL, 0);
      if (value_len < 0) { return OsResultFromErrno(errno); }
      if (value_len == 0) { return OsResult::Ok(); }

      value.assign(value_len, 0);
      value_len = lgetxattr(path.c_str(), name.c_str(), value.data(),
                            value.size());
      if (value_len < 0) {
        if (errno == ERANGE) { continue; }
        value.clear();
        return OsResultFromErrno(errno);
      }
      break;
    }
    value.resize(value_len);
    return OsResult::Ok();
  }

  OsResult Set(const std::string& path,
               const std::string& name,
               const std::vector<char>& value) override
  {
    if (lsetxattr(path.c_str(), name.c_str(), value.data(), value.size(), 0)
        != 0) {
      return OsResultFromErrno(errno);
    }
    return OsResult::Ok();
  }
};

#elif defined(HAVE_EXTATTR)

static const char kUserNamespacePrefix[] = "user.";

// Only the user namespace is accessible without privileges.
class SystemXattr : public XattrOps {
 public:
  OsResult List(const std::string& path,
                std::vector<std::string>& names) override
  {
    std::vector<char> list;
    ssize_t list_len;

    names.clear();
    list_len = extattr_list_link(path.c_str(), EXTATTR_NAMESPACE_USER, NULL, 0);
    if (list_len < 0) { return OsResultFromErrno(errno); }
    if (list_len == 0) { return OsResult::Ok(); }

    list.assign(list_len, 0);
    list_len = extattr_list_link(path.c_str(), EXTATTR_NAMESPACE_USER,
                                 list.data(), list.size());
    if (list_len < 0) { return OsResultFromErrno(errno); }

    // Every name is preceded by its length, there is no terminating 0.
    for (ssize_t index = 0; index < list_len;
         index += static_cast<unsigned char>(list[index]) + 1) {
      int cnt = static_cast<unsigned char>(list[index]);
      if (index + 1 + cnt > list_len) { break; }
      names.push_back(kUserNamespacePrefix
                      + std::string(list.data() + index + 1, cnt));
    }
    return OsResult::Ok();
  }

  OsResult Get(const std::string& path,
               const std::string& name,
               std::vector<char>& value) override
  {
    std::string attrname;
    ssize_t value_len;

    value.clear();
    if (!StripUserNamespace(name, attrname)) {
      return OsResultFromErrno(EOPNOTSUPP);
    }

    value_len = extattr_get_link(path.c_str(), EXTATTR_NAMESPACE_USER,
                                 attrname.c_str(), NULL, 0);
    if (value_len < 0) { return OsResultFromErrno(errno); }
    if (value_len == 0) { return OsResult::Ok(); }

    value.assign(value_len, 0);
    value_len = extattr_get_link(path.c_str(), EXTATTR_NAMESPACE_USER,
                                 attrname.c_str(), value.data(), value.size());
    if (value_len < 0) {
      value.clear();
      return OsResultFromErrno(errno);
    }
    value.resize(value_len);
    return OsResult::Ok();
  }

  OsResult Set(const std::string& path,
               const std::string& name,
               const std::vector<char>& value) override
  {
    std::string attrname;

    if (!StripUserNamespace(name, attrname)) {
      return OsResultFromErrno(EOPNOTSUPP);
    }
    if (extattr_set_link(path.c_str(), EXTATTR_NAMESPACE_USER,
                         attrname.c_str(), value.data(), value.size())
        < 0) {
      return OsResultFromErrno(errno);
    }
    return OsResult::Ok();
  }

 private:
  static bool StripUserNamespace(const std::string& name, std::string& attrname)
  {
    const std::size_t len = sizeof(kUserNamespacePrefix) - 1;

    if (name.compare(0, len, kUserNamespacePrefix) != 0) { return false; }
    attrname = name.substr(len);
    return true;
  }
};

#else

// Entry points when compiled without support for XATTRs.
class SystemXattr : public XattrOps {
 public:
  OsResult List(const std::string&, std::vector<std::string>& names) override
  {
    names.clear();
    return OsResultFromErrno(EOPNOTSUPP);
  }
  OsResult Get(const std::string&,
               const std::string&,
               std::vector<char>& value) override
  {
    value.clear();
    return OsResultFromErrno(EOPNOTSUPP);
  }
  OsResult Set(const std::string&,
               const std::string&,
               const std::vector<char>&) override
  {
    return OsResultFromErrno(EOPNOTSUPP);
  }
};

#endif

XattrOps& SystemXattrOps()
{
  static SystemXattr system_xattr;
  return system_xattr;
}

static void WarnIfDisablingXattrs(const std::string& path)
{
  Dmsg1(100,
        "Disabling XATTRs on this filesystem, not supported. Current file: "
        "\"%s\"\n",
        path.c_str());
}

BattrExitCode FillExtendedAttributes(XattrOps& ops,
                                     const std::string& path,
                                     std::vector<ExtendedAttribute>& attrs,
                                     std::string& errmsg,
                                     XattrState* state)
{
  std::vector<std::string> names;
  BattrExitCode retval = BattrExitCode::kError;

  attrs.clear();
  if (state && !(state->flags & BXATTR_FLAG_SAVE_NATIVE)) {
    return BattrExitCode::kSuccess;
  }

  OsResult result = ops.List(path, names);
  switch (result.code) {
    case OsResultCode::kOk:
      break;
    case OsResultCode::kNotSupported:
      /* If the filesystem reports it doesn't support XATTRs we clear
       * the BXATTR_FLAG_SAVE_NATIVE flag so we skip XATTR saves
       * on all other files on the same filesystem. */
      if (state) {
        state->flags &= ~BXATTR_FLAG_SAVE_NATIVE;
        WarnIfDisablingXattrs(path);
      }
      return BattrExitCode::kSuccess;
    case OsResultCode::kNoData:
      return BattrExitCode::kSuccess;
    default:
      Mmsg(errmsg, T_("llistxattr error on file \"%s\": ERR=%s\n"),
           path.c_str(), result.message.c_str());
      Dmsg2(100, "llistxattr error file=%s ERR=%s\n", path.c_str(),
            result.message.c_str());
      goto bail_out;
  }

  /* Walk the list of extended attributes names and retrieve the data.
   * A value that can not be fetched is skipped. */
  for (const auto& name : names) {
    if (XattrNameIsSkipped(name)) {
      Dmsg1(100, "Skipping xattr named %s\n", name.c_str());
      continue;
    }

    ExtendedAttribute current_xattr;
    current_xattr.name = name;

    result = ops.Get(path, name, current_xattr.value);
    if (!result.ok()) {
      Emsg3(M_WARNING, 0,
            T_("can not obtain extended attribute %s of \"%s\": ERR=%s\n"),
            name.c_str(), path.c_str(), result.message.c_str());
      continue;
    }

    attrs.push_back(std::move(current_xattr));
  }

  return BattrExitCode::kSuccess;

bail_out:
  attrs.clear();
  return retval;
}

BattrExitCode RestoreExtendedAttributes(
    XattrOps& ops,
    const std::string& path,
    const std::vector<ExtendedAttribute>& attrs,
    std::string& errmsg,
    XattrState* state)
{
  if (state && !(state->flags & BXATTR_FLAG_RESTORE_NATIVE)) {
    return BattrExitCode::kSuccess;
  }

  std::size_t not_supported = 0;

  for (const auto& current_xattr : attrs) {
    OsResult result = ops.Set(path, current_xattr.name, current_xattr.value);

    switch (result.code) {
      case OsResultCode::kOk:
        break;
      case OsResultCode::kNotSupported:
        /* Linux reports this per namespace (trusted.* or security.* as non
         * root), so the remaining attributes are still tried. */
        Dmsg2(200, "xattr %s not supported on %s\n",
              current_xattr.name.c_str(), path.c_str());
        ++not_supported;
        break;
      case OsResultCode::kNoData:
        break;
      default:
        Mmsg(errmsg, T_("lsetxattr error on file \"%s\": ERR=%s\n"),
             path.c_str(), result.message.c_str());
        Dmsg2(100, "lsetxattr error file=%s ERR=%s\n", path.c_str(),
              result.message.c_str());
        return BattrExitCode::kError;
    }
  }

  /* Only when not a single attribute could be set the filesystem is taken
   * as not supporting XATTRs and further restores on it are skipped. */
  if (state && !attrs.empty() && not_supported == attrs.size()) {
    state->flags &= ~BXATTR_FLAG_RESTORE_NATIVE;
    WarnIfDisablingXattrs(path);
  }

  return BattrExitCode::kSuccess;
}

}  // namespace metakeep
