#pragma once

#define POINTERHOLDER_TRANSITION 1

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFWriter.hh>

namespace pdf_a11y {

enum class SaveMode { Unchanged, Incremental, FullRewrite };

/**
 * A thin RAII wrapper around one QPDF instance opened on a working copy.
 *
 * - Only one QPDF parse per PDF file.
 * - Every indirect object the engine creates or modifies is recorded, so
 *   save() can append exactly those objects as an incremental update.
 * - Non-copyable but movable. close() is idempotent and the destructor
 *   calls it.
 */
class DocumentHandle final {
 public:
  using DirtySet = std::map<QPDFObjGen, QPDFObjectHandle>;

  // ---- factory ----------------------------------------------------------
  static std::unique_ptr<DocumentHandle> open(std::string const& filename,
                                              std::shared_ptr<QPDFLogger> logger = nullptr);
  static std::unique_ptr<DocumentHandle> open_memory(std::string const& description, std::string data,
                                                     std::shared_ptr<QPDFLogger> logger = nullptr);

  // ---- change tracking --------------------------------------------------
  void mark_dirty(QPDFObjectHandle oh);
  QPDFObjectHandle make_indirect(QPDFObjectHandle direct);
  QPDFObjectHandle new_stream(std::string const& data);

  DirtySet const& dirty() const { return m_dirty; }
  void restore_dirty(DirtySet const& state) { m_dirty = state; }
  bool has_changes() const { return !m_dirty.empty() || m_trailer_changed; }
  void mark_trailer_changed() { m_trailer_changed = true; }

  // ---- output -----------------------------------------------------------
  /** Empty when save(true) can append, otherwise why it cannot. */
  std::string incremental_blocker() const;

  /** Persists pending changes to the file the handle was opened from. */
  SaveMode save(bool incremental);

  /** Full rewrite to another file. */
  void write(std::string const& out_filename);

  std::string write_to_memory();

  void close();
  bool is_closed() const { return !m_qpdf; }

  // ---- access -----------------------------------------------------------
  QPDF& qpdf();
  QPDF const& qpdf() const;
  std::string const& filename() const { return m_filename; }
  std::vector<QPDFObjectHandle> const& pages();
  QPDFObjectHandle page(int index);

  // ---- rule of five -----------------------------------------------------
  ~DocumentHandle();
  DocumentHandle(DocumentHandle const&) = delete;
  DocumentHandle& operator=(DocumentHandle const&) = delete;
  DocumentHandle(DocumentHandle&&) noexcept = default;
  DocumentHandle& operator=(DocumentHandle&&) noexcept = default;

 private:
  DocumentHandle(std::shared_ptr<QPDF> qpdf, std::string filename);

  void rewrite_in_place();

  std::shared_ptr<QPDF> m_qpdf;
  std::string m_filename;
  std::string m_owned_buf;
  bool m_encrypted = false;
  bool m_repaired = false;
  bool m_trailer_changed = false;
  DirtySet m_dirty;
};

extern "C" {
/** Returns a freshly allocated handle; throws std::runtime_error on error. */
DocumentHandle* pdf_a11y_open(char const* filename);

DocumentHandle* pdf_a11y_open_memory(char const* desc, unsigned char const* buf, size_t len);

/** Writes PDF; returns 0 on success, -1 on error (see errno). */
int pdf_a11y_write(DocumentHandle* handle, char const* out_filename);

/** Deletes the handle (idempotent). */
void pdf_a11y_close(DocumentHandle* handle);
}

}  // namespace pdf_a11y
