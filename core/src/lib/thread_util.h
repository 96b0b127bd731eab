/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2023-2026 Bareos GmbH & Co. KG

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
#ifndef METAKEEP_LIB_THREAD_UTIL_H_
#define METAKEEP_LIB_THREAD_UTIL_H_

#include <mutex>
#include <shared_mutex>
#include <utility>

/* A pointer to data that is only valid while the lock is held. */
template <typename T, typename Mutex, template <typename> typename Lock>
class locked {
 public:
  locked(Mutex& t_mut, T* t_data) : lock{t_mut}, data(t_data) {}

  locked(const locked&) = delete;
  locked& operator=(const locked&) = delete;
  locked(locked&& that) : lock(std::move(that.lock)), data(that.data)
  {
    that.data = nullptr;
  }

  T& get() { return *data; }
  T& operator*() { return *data; }
  T* operator->() { return data; }

  const T& get() const { return *data; }
  const T& operator*() const { return *data; }
  const T* operator->() const { return data; }

 private:
  Lock<Mutex> lock;
  T* data;
};

template <typename T>
using read_locked = locked<const T, std::shared_mutex, std::shared_lock>;
template <typename T>
using write_locked = locked<T, std::shared_mutex, std::unique_lock>;

/* Many concurrent readers, one writer. */
template <typename T> class rw_synchronized {
 public:
  template <typename... Args>
  rw_synchronized(Args... args) : data{std::forward<Args>(args)...}
  {
  }

  [[nodiscard]] write_locked<T> wlock() { return {mut, &data}; }
  [[nodiscard]] read_locked<T> rlock() const { return {mut, &data}; }

 private:
  mutable std::shared_mutex mut{};
  T data;
};

#endif  // METAKEEP_LIB_THREAD_UTIL_H_
