#include "pdfium_document.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include <fpdf_edit.h>
#include <fpdf_ppo.h>
#include <fpdf_save.h>
#include <fpdf_text.h>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"
#include "log.hpp"
#include "text_util.hpp"

namespace pdfmask {

namespace {

// Helvetica metrics, fraction of the font size.
constexpr double kAscent = 0.718;
constexpr double kDescent = 0.207;

const char *load_error_str(unsigned long err) {
    switch (err) {
        case FPDF_ERR_FILE: return "file not found or could not be opened";
        case FPDF_ERR_FORMAT: return "not a PDF or corrupted";
        case FPDF_ERR_PASSWORD: return "password required or incorrect";
        case FPDF_ERR_SECURITY: return "unsupported security scheme";
        case FPDF_ERR_PAGE: return "page not found or content error";
        default: return "unknown error";
    }
}

struct BufferWriter : FPDF_FILEWRITE {
    Bytes *out = nullptr;
};

int write_block(FPDF_FILEWRITE *self, const void *data, unsigned long size) {
    auto *w = static_cast<BufferWriter *>(self);
    const auto *p = static_cast<const unsigned char *>(data);
    w->out->insert(w->out->end(), p, p + size);
    return 1;
}

Bytes save_document(FPDF_DOCUMENT doc, FPDF_DWORD flags) {
    Bytes out;
    BufferWriter writer;
    writer.version = 1;
    writer.WriteBlock = &write_block;
    writer.out = &out;
    if (!FPDF_SaveAsCopy(doc, &writer, flags)) throw IoError("PDF serialisation failed");
    return out;
}

FPDF_WIDESTRING wide(const std::u16string &s) { return reinterpret_cast<FPDF_WIDESTRING>(s.c_str()); }

bool is_space_unit(unsigned int u) {
    return u == ' ' || u == '\t' || u == '\r' || u == '\n' || u == 0xA0 || u == 0x3000 || u == 0;
}

void append_unit(std::u16string &s, unsigned int u) {
    if (u >= 0x10000) {
        u -= 0x10000;
        s += static_cast<char16_t>(0xD800 + (u >> 10));
        s += static_cast<char16_t>(0xDC00 + (u & 0x3FF));
    } else {
        s += static_cast<char16_t>(u);
    }
}

// A glyph is under a mark when at least half of its box is, or, for glyphs
// with an empty box (spaces), when the centre of its loose box is.
bool char_covered(FPDF_TEXTPAGE tp, int i, const std::vector<Rect> &marks) {
    double l = 0, r = 0, b = 0, t = 0;
    if (!FPDFText_GetCharBox(tp, i, &l, &r, &b, &t)) return false;
    Rect box = Rect{l, b, r, t}.normalized();
    if (box.empty()) {
        FS_RECTF loose;
        if (!FPDFText_GetLooseCharBox(tp, i, &loose)) return false;
        double cx = (loose.left + loose.right) / 2.0;
        double cy = (loose.top + loose.bottom) / 2.0;
        for (auto &m : marks) {
            if (cx >= m.x0 && cx <= m.x1 && cy >= m.y0 && cy <= m.y1) return true;
        }
        return false;
    }
    const double area = box.width() * box.height();
    for (auto &m : marks) {
        double ov = span_overlap(box.x0, box.x1, m.x0, m.x1) * span_overlap(box.y0, box.y1, m.y0, m.y1);
        if (ov >= 0.5 * area) return true;
    }
    return false;
}

Rect object_bounds(FPDF_PAGEOBJECT obj) {
    float l = 0, b = 0, r = 0, t = 0;
    if (!FPDFPageObj_GetBounds(obj, &l, &b, &r, &t)) return {};
    return Rect{l, b, r, t}.normalized();
}

// A page object and the matrix from its container's space to page space.
struct PlacedObject {
    FPDF_PAGEOBJECT obj = nullptr;
    FPDF_PAGEOBJECT form = nullptr; // null for objects placed directly on the page
    FS_MATRIX ctm{1, 0, 0, 1, 0, 0};
};

// m applied first, then n.
FS_MATRIX concat(const FS_MATRIX &m, const FS_MATRIX &n) {
    FS_MATRIX r;
    r.a = m.a * n.a + m.b * n.c;
    r.b = m.a * n.b + m.b * n.d;
    r.c = m.c * n.a + m.d * n.c;
    r.d = m.c * n.b + m.d * n.d;
    r.e = m.e * n.a + m.f * n.c + n.e;
    r.f = m.e * n.b + m.f * n.d + n.f;
    return r;
}

Rect transform_rect(const Rect &r, const FS_MATRIX &m) {
    const double xs[4] = {r.x0, r.x1, r.x0, r.x1};
    const double ys[4] = {r.y0, r.y0, r.y1, r.y1};
    Rect out;
    for (int i = 0; i < 4; ++i) {
        const double x = xs[i] * m.a + ys[i] * m.c + m.e;
        const double y = xs[i] * m.b + ys[i] * m.d + m.f;
        Rect p{x, y, x, y};
        out = i == 0 ? p : out.united(p);
    }
    return out;
}

void collect_form(FPDF_PAGEOBJECT form, const FS_MATRIX &outer, std::vector<PlacedObject> &out) {
    FS_MATRIX fm{1, 0, 0, 1, 0, 0};
    FPDFPageObj_GetMatrix(form, &fm);
    const FS_MATRIX ctm = concat(fm, outer);
    const int n = FPDFFormObj_CountObjects(form);
    for (int i = 0; i < n; ++i) {
        FPDF_PAGEOBJECT o = FPDFFormObj_GetObject(form, static_cast<unsigned long>(i));
        if (!o) continue;
        out.push_back(PlacedObject{o, form, ctm});
        if (FPDFPageObj_GetType(o) == FPDF_PAGEOBJ_FORM) collect_form(o, ctm, out);
    }
}

// Takes the object out of its container. The caller owns it afterwards.
bool detach(FPDF_PAGE page, const PlacedObject &p) {
    return p.form ? FPDFFormObj_RemoveObject(p.form, p.obj) : FPDFPage_RemoveObject(page, p.obj);
}

struct KeptGlyph {
    unsigned int unicode = 0;
    double x = 0, y = 0;
};

// A text object touched by a mark and the glyphs of it that survive.
struct TextRewrite {
    PlacedObject placed;
    FPDF_FONT font = nullptr;
    float font_size = 0;
    FS_MATRIX matrix{1, 0, 0, 1, 0, 0}; // text space to page space
    unsigned int rgba[4] = {0, 0, 0, 255};
    FPDF_TEXT_RENDERMODE render_mode = FPDF_TEXTRENDERMODE_FILL;
    std::vector<KeptGlyph> glyphs;
};

// Overwrites the pixels of `obj` that fall under `marks` with white. `m` maps
// the image's unit square to page space. Returns false when the image could
// not be rewritten.
bool whiten_image_pixels(FPDF_PAGEOBJECT obj, const FS_MATRIX &m, const std::vector<Rect> &marks) {
    const double det = static_cast<double>(m.a) * m.d - static_cast<double>(m.b) * m.c;
    if (std::fabs(det) < 1e-9) return false;

    FPDF_BITMAP bmp = FPDFImageObj_GetBitmap(obj);
    if (!bmp) return false;
    int bpp = 0;
    switch (FPDFBitmap_GetFormat(bmp)) {
        case FPDFBitmap_Gray: bpp = 1; break;
        case FPDFBitmap_BGR: bpp = 3; break;
        case FPDFBitmap_BGRx:
        case FPDFBitmap_BGRA: bpp = 4; break;
        default: break;
    }
    if (bpp == 0) {
        FPDFBitmap_Destroy(bmp);
        return false;
    }
    const int w = FPDFBitmap_GetWidth(bmp);
    const int h = FPDFBitmap_GetHeight(bmp);
    const int stride = FPDFBitmap_GetStride(bmp);
    auto *buf = static_cast<unsigned char *>(FPDFBitmap_GetBuffer(bmp));

    // page point -> unit square -> pixel grid (row 0 at the top)
    auto to_pixel = [&](double px, double py, double &col, double &row) {
        double u = (m.d * (px - m.e) - m.c * (py - m.f)) / det;
        double v = (-m.b * (px - m.e) + m.a * (py - m.f)) / det;
        col = u * w;
        row = (1.0 - v) * h;
    };

    bool changed = false;
    for (auto &mark : marks) {
        double cols[4], rows[4];
        to_pixel(mark.x0, mark.y0, cols[0], rows[0]);
        to_pixel(mark.x1, mark.y0, cols[1], rows[1]);
        to_pixel(mark.x0, mark.y1, cols[2], rows[2]);
        to_pixel(mark.x1, mark.y1, cols[3], rows[3]);
        int c0 = std::max(0, static_cast<int>(std::floor(*std::min_element(cols, cols + 4))));
        int c1 = std::min(w, static_cast<int>(std::ceil(*std::max_element(cols, cols + 4))));
        int r0 = std::max(0, static_cast<int>(std::floor(*std::min_element(rows, rows + 4))));
        int r1 = std::min(h, static_cast<int>(std::ceil(*std::max_element(rows, rows + 4))));
        if (c1 <= c0 || r1 <= r0) continue;
        for (int y = r0; y < r1; ++y) {
            std::fill(buf + static_cast<size_t>(y) * stride + static_cast<size_t>(c0) * bpp,
                      buf + static_cast<size_t>(y) * stride + static_cast<size_t>(c1) * bpp, 0xFF);
        }
        changed = true;
    }
    bool ok = !changed || FPDFImageObj_SetBitmap(nullptr, 0, obj, bmp);
    FPDFBitmap_Destroy(bmp);
    return ok;
}

} // namespace

std::recursive_mutex &pdfium_mutex() {
    static std::recursive_mutex mu;
    return mu;
}

void pdfium_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        FPDF_LIBRARY_CONFIG config{};
        config.version = 2;
        FPDF_InitLibraryWithConfig(&config);
    });
}

// ---------------- Page ----------------

PdfiumPage::~PdfiumPage() {
    drop_text_page();
    if (page_) FPDF_ClosePage(page_);
}

FPDF_TEXTPAGE PdfiumPage::text_page() {
    if (!text_) text_ = FPDFText_LoadPage(page_);
    return text_;
}

void PdfiumPage::drop_text_page() {
    if (text_) {
        FPDFText_ClosePage(text_);
        text_ = nullptr;
    }
}

std::string PdfiumPage::text() {
    FPDF_TEXTPAGE tp = text_page();
    if (!tp) return "";
    const int count = FPDFText_CountChars(tp);
    if (count <= 0) return "";
    std::u16string buf(static_cast<size_t>(count) + 1, u'\0');
    int written = FPDFText_GetText(tp, 0, count, reinterpret_cast<unsigned short *>(&buf[0]));
    buf.resize(written > 0 ? static_cast<size_t>(written - 1) : 0);
    return utf16_to_utf8(buf);
}

bool PdfiumPage::has_text() {
    FPDF_TEXTPAGE tp = text_page();
    if (!tp) return false;
    const int count = FPDFText_CountChars(tp);
    for (int i = 0; i < count; ++i) {
        if (!is_space_unit(FPDFText_GetUnicode(tp, i))) return true;
    }
    return false;
}

std::vector<PositionedWord> PdfiumPage::words() {
    std::vector<PositionedWord> out;
    FPDF_TEXTPAGE tp = text_page();
    if (!tp) return out;

    std::u16string cur;
    Rect box;
    bool have_box = false;
    auto flush = [&] {
        if (!cur.empty() && have_box) {
            PositionedWord w;
            w.box = box;
            w.text = utf16_to_utf8(cur);
            w.sequence_index = out.size();
            out.push_back(std::move(w));
        }
        cur.clear();
        have_box = false;
    };

    const int count = FPDFText_CountChars(tp);
    for (int i = 0; i < count; ++i) {
        const unsigned int u = FPDFText_GetUnicode(tp, i);
        if (is_space_unit(u)) {
            flush();
            continue;
        }
        append_unit(cur, u);
        double l = 0, r = 0, b = 0, t = 0;
        if (FPDFText_GetCharBox(tp, i, &l, &r, &b, &t)) {
            Rect cb = Rect{l, b, r, t}.normalized();
            box = have_box ? box.united(cb) : cb;
            have_box = true;
        }
    }
    flush();
    return out;
}

std::vector<Rect> PdfiumPage::search(const std::string &needle) {
    std::vector<Rect> out;
    FPDF_TEXTPAGE tp = text_page();
    if (!tp || needle.empty()) return out;

    const std::u16string what = utf8_to_utf16(needle);
    FPDF_SCHHANDLE sh = FPDFText_FindStart(tp, wide(what), 0, 0); // no flags: case-insensitive
    if (!sh) return out;
    while (FPDFText_FindNext(sh)) {
        const int start = FPDFText_GetSchResultIndex(sh);
        const int count = FPDFText_GetSchCount(sh);
        const int rects = FPDFText_CountRects(tp, start, count);
        for (int j = 0; j < rects; ++j) {
            double l = 0, t = 0, r = 0, b = 0;
            if (FPDFText_GetRect(tp, j, &l, &t, &r, &b)) out.push_back(Rect{l, b, r, t}.normalized());
        }
    }
    FPDFText_FindClose(sh);
    return out;
}

void PdfiumPage::add_redaction(const Rect &area) { marks_.push_back(area.normalized()); }

std::vector<std::size_t> PdfiumPage::count_residual(const std::vector<Rect> &marks) {
    std::vector<std::size_t> out;
    FPDF_TEXTPAGE tp = text_page();
    if (!tp) return out;
    std::vector<bool> dirty(marks.size(), false);
    const int count = FPDFText_CountChars(tp);
    for (int i = 0; i < count; ++i) {
        if (FPDFText_IsGenerated(tp, i) == 1 || is_space_unit(FPDFText_GetUnicode(tp, i))) continue;
        for (size_t k = 0; k < marks.size(); ++k) {
            if (!dirty[k] && char_covered(tp, i, {marks[k]})) dirty[k] = true;
        }
    }
    for (size_t k = 0; k < marks.size(); ++k) {
        if (dirty[k]) out.push_back(k);
    }
    return out;
}

std::vector<std::size_t> PdfiumPage::apply_redactions() {
    if (marks_.empty()) return {};
    const std::vector<Rect> marks = std::move(marks_);
    marks_.clear();
    FPDF_DOCUMENT doc = owner_.handle();
    auto touches = [&](const Rect &r) {
        return std::any_of(marks.begin(), marks.end(), [&](const Rect &m) { return r.intersects(m); });
    };

    std::vector<PlacedObject> objects;
    const FS_MATRIX identity{1, 0, 0, 1, 0, 0};
    const int nobj = FPDFPage_CountObjects(page_);
    for (int i = 0; i < nobj; ++i) {
        FPDF_PAGEOBJECT o = FPDFPage_GetObject(page_, i);
        if (!o) continue;
        objects.push_back(PlacedObject{o, nullptr, identity});
        if (FPDFPageObj_GetType(o) == FPDF_PAGEOBJ_FORM) collect_form(o, identity, objects);
    }
    std::map<FPDF_PAGEOBJECT, PlacedObject> where;
    for (auto &p : objects) where[p.obj] = p;

    // 1. glyph level plan for every text object touched by a mark
    std::vector<TextRewrite> rewrites;
    if (FPDF_TEXTPAGE tp = text_page()) {
        std::map<FPDF_PAGEOBJECT, std::vector<std::pair<int, bool>>> chars;
        std::vector<FPDF_PAGEOBJECT> touched;
        const int count = FPDFText_CountChars(tp);
        for (int i = 0; i < count; ++i) {
            if (FPDFText_IsGenerated(tp, i) == 1) continue;
            FPDF_PAGEOBJECT obj = FPDFText_GetTextObject(tp, i);
            if (!obj || !where.count(obj)) continue;
            bool removed = char_covered(tp, i, marks);
            chars[obj].emplace_back(i, removed);
            if (removed && std::find(touched.begin(), touched.end(), obj) == touched.end()) touched.push_back(obj);
        }
        for (FPDF_PAGEOBJECT obj : touched) {
            TextRewrite rw;
            rw.placed = where[obj];
            rw.font = FPDFTextObj_GetFont(obj);
            FPDFTextObj_GetFontSize(obj, &rw.font_size);
            FS_MATRIX tm;
            if (!FPDFPageObj_GetMatrix(obj, &tm)) tm = identity;
            rw.matrix = concat(tm, rw.placed.ctm);
            FPDFPageObj_GetFillColor(obj, &rw.rgba[0], &rw.rgba[1], &rw.rgba[2], &rw.rgba[3]);
            FPDF_TEXT_RENDERMODE mode = FPDFTextObj_GetTextRenderMode(obj);
            if (mode != FPDF_TEXTRENDERMODE_UNKNOWN) rw.render_mode = mode;
            for (auto &c : chars[obj]) {
                if (c.second) continue;
                KeptGlyph g;
                g.unicode = FPDFText_GetUnicode(tp, c.first);
                if (g.unicode == 0) continue;
                FPDFText_GetCharOrigin(tp, c.first, &g.x, &g.y);
                rw.glyphs.push_back(g);
            }
            rewrites.push_back(std::move(rw));
        }
    }
    // the text page points into the objects we are about to destroy
    drop_text_page();

    // 2. survivors are built while the original fonts are still in use
    std::vector<std::vector<FPDF_PAGEOBJECT>> survivors(rewrites.size());
    for (size_t k = 0; k < rewrites.size(); ++k) {
        const TextRewrite &rw = rewrites[k];
        const float size = rw.font_size > 0 ? rw.font_size : 1.0f;
        for (auto &g : rw.glyphs) {
            FPDF_PAGEOBJECT t = rw.font ? FPDFPageObj_CreateTextObj(doc, rw.font, size)
                                        : FPDFPageObj_NewTextObj(doc, "Helvetica", size);
            if (!t) continue;
            std::u16string text;
            append_unit(text, g.unicode);
            if (!FPDFText_SetText(t, wide(text))) {
                FPDFPageObj_Destroy(t);
                continue;
            }
            FPDFPageObj_Transform(t, rw.matrix.a, rw.matrix.b, rw.matrix.c, rw.matrix.d, g.x, g.y);
            FPDFPageObj_SetFillColor(t, rw.rgba[0], rw.rgba[1], rw.rgba[2], rw.rgba[3]);
            FPDFTextObj_SetTextRenderMode(t, rw.render_mode);
            survivors[k].push_back(t);
        }
    }
    std::vector<FPDF_PAGEOBJECT> dropped;
    for (size_t k = 0; k < rewrites.size(); ++k) {
        if (detach(page_, rewrites[k].placed)) {
            dropped.push_back(rewrites[k].placed.obj);
            continue;
        }
        log_warn("redact", "text object could not be removed");
        for (FPDF_PAGEOBJECT t : survivors[k]) FPDFPageObj_Destroy(t);
        survivors[k].clear();
    }

    // 3. images and enclosed vector art, at any depth
    for (auto &p : objects) {
        const int type = FPDFPageObj_GetType(p.obj);
        const Rect bounds = transform_rect(object_bounds(p.obj), p.ctm);
        if (type == FPDF_PAGEOBJ_IMAGE) {
            if (!touches(bounds)) continue;
            FS_MATRIX im;
            if (!FPDFPageObj_GetMatrix(p.obj, &im)) im = identity;
            const FS_MATRIX placed = concat(im, p.ctm);
            if (p.form) {
                // lift it out of the form so the rewritten pixels reach the page content
                if (!detach(page_, p)) {
                    log_warn("redact", "image inside a form could not be rewritten");
                    continue;
                }
                FPDFPageObj_SetMatrix(p.obj, &placed);
                if (whiten_image_pixels(p.obj, placed, marks)) {
                    FPDFPage_InsertObject(page_, p.obj);
                } else {
                    log_warn("redact", "image could not be rewritten, removing it");
                    FPDFPageObj_Destroy(p.obj);
                }
            } else if (!whiten_image_pixels(p.obj, placed, marks)) {
                log_warn("redact", "image could not be rewritten, removing it");
                if (FPDFPage_RemoveObject(page_, p.obj)) FPDFPageObj_Destroy(p.obj);
            }
        } else if (type == FPDF_PAGEOBJ_PATH) {
            bool inside = std::any_of(marks.begin(), marks.end(), [&](const Rect &m) { return m.contains(bounds); });
            if (inside && detach(page_, p)) FPDFPageObj_Destroy(p.obj);
        }
    }

    for (auto &list : survivors) {
        for (FPDF_PAGEOBJECT t : list) FPDFPage_InsertObject(page_, t);
    }
    for (FPDF_PAGEOBJECT obj : dropped) FPDFPageObj_Destroy(obj);

    // 4. white fill on top
    for (auto &m : marks) {
        FPDF_PAGEOBJECT r = FPDFPageObj_CreateNewRect(static_cast<float>(m.x0), static_cast<float>(m.y0),
                                                      static_cast<float>(m.width()), static_cast<float>(m.height()));
        if (!r) continue;
        FPDFPageObj_SetFillColor(r, 255, 255, 255, 255);
        FPDFPath_SetDrawMode(r, FPDF_FILLMODE_WINDING, 0);
        FPDFPage_InsertObject(page_, r);
    }

    if (!FPDFPage_GenerateContent(page_)) throw IoError("could not regenerate page content");
    return count_residual(marks);
}

bool PdfiumPage::insert_label(const Rect &box, const std::string &label, double font_size) {
    const Rect b = box.normalized();
    if (b.empty() || font_size <= 0) return false;
    FPDF_PAGEOBJECT t = FPDFPageObj_NewTextObj(owner_.handle(), "Helvetica", static_cast<float>(font_size));
    if (!t) return false;
    const std::u16string text = utf8_to_utf16(label);
    if (!FPDFText_SetText(t, wide(text))) {
        FPDFPageObj_Destroy(t);
        return false;
    }
    const Rect ink = object_bounds(t);
    const double width = ink.width();
    if (width > b.width() || (kAscent + kDescent) * font_size > b.height()) {
        FPDFPageObj_Destroy(t);
        return false;
    }
    const double x = b.x0 + (b.width() - width) / 2.0 - ink.x0;
    const double baseline = b.y0 + (b.height() - (kAscent + kDescent) * font_size) / 2.0 + kDescent * font_size;
    FPDFPageObj_Transform(t, 1, 0, 0, 1, x, baseline);
    FPDFPageObj_SetFillColor(t, 0, 0, 0, 255);
    FPDFPage_InsertObject(page_, t);
    drop_text_page();
    if (!FPDFPage_GenerateContent(page_)) throw IoError("could not regenerate page content");
    return true;
}

cv::Mat PdfiumPage::render(int dpi) {
    const int w = std::max(1, static_cast<int>(FPDF_GetPageWidthF(page_) * dpi / 72.0 + 0.5));
    const int h = std::max(1, static_cast<int>(FPDF_GetPageHeightF(page_) * dpi / 72.0 + 0.5));
    FPDF_BITMAP bmp = FPDFBitmap_Create(w, h, 0);
    if (!bmp) throw EngineError("could not allocate a " + std::to_string(w) + "x" + std::to_string(h) + " bitmap");
    FPDFBitmap_FillRect(bmp, 0, 0, w, h, 0xFFFFFFFF);
    FPDF_RenderPageBitmap(bmp, page_, 0, 0, w, h, 0, FPDF_ANNOT | FPDF_PRINTING);
    cv::Mat view(h, w, CV_8UC4, FPDFBitmap_GetBuffer(bmp), static_cast<size_t>(FPDFBitmap_GetStride(bmp)));
    cv::Mat out;
    cv::cvtColor(view, out, cv::COLOR_BGRA2BGR);
    FPDFBitmap_Destroy(bmp);
    return out;
}

int PdfiumPage::rotation() const { return FPDFPage_GetRotation(page_) * 90; }

void PdfiumPage::rotate(int clockwise_degrees) {
    const int steps = ((clockwise_degrees / 90) % 4 + 4) % 4;
    FPDFPage_SetRotation(page_, (FPDFPage_GetRotation(page_) + steps) % 4);
    drop_text_page();
}

// ---------------- Document ----------------

PdfiumDocument::PdfiumDocument(Bytes data, const std::string &password)
    : lock_(pdfium_mutex()), data_(std::move(data)) {
    pdfium_init();
    doc_ = FPDF_LoadMemDocument64(data_.data(), data_.size(), password.empty() ? nullptr : password.c_str());
    if (!doc_) throw IoError(std::string("cannot open PDF: ") + load_error_str(FPDF_GetLastError()));
    encrypted_ = FPDF_GetSecurityHandlerRevision(doc_) != -1;
    pages_.resize(static_cast<size_t>(std::max(0, FPDF_GetPageCount(doc_))));
}

PdfiumDocument::~PdfiumDocument() {
    pages_.clear();
    if (doc_) FPDF_CloseDocument(doc_);
}

int PdfiumDocument::page_count() const { return static_cast<int>(pages_.size()); }

PdfiumPage &PdfiumDocument::pdfium_page(int index) {
    if (index < 0 || index >= page_count()) throw IoError("page index out of range: " + std::to_string(index));
    auto &slot = pages_[static_cast<size_t>(index)];
    if (!slot) {
        FPDF_PAGE p = FPDF_LoadPage(doc_, index);
        if (!p) throw IoError("cannot load page " + std::to_string(index + 1));
        slot.reset(new PdfiumPage(*this, p));
    }
    return *slot;
}

Page &PdfiumDocument::page(int index) { return pdfium_page(index); }

Bytes PdfiumDocument::save() {
    return save_document(doc_, encrypted_ ? FPDF_REMOVE_SECURITY : FPDF_NO_INCREMENTAL);
}

std::unique_ptr<Document> PdfiumProvider::open(const Bytes &data) const {
    return std::unique_ptr<Document>(new PdfiumDocument(data, password_));
}

// ---------------- Assembler ----------------

PdfAssembler::PdfAssembler() : lock_(pdfium_mutex()) {
    pdfium_init();
    doc_ = FPDF_CreateNewDocument();
    if (!doc_) throw IoError("cannot create PDF document");
}

PdfAssembler::~PdfAssembler() {
    if (doc_) FPDF_CloseDocument(doc_);
}

void PdfAssembler::append(PdfiumDocument &src, int page_index) {
    const int idx[] = {page_index};
    if (!FPDF_ImportPagesByIndex(doc_, src.handle(), idx, 1, page_count())) {
        throw IoError("cannot copy page " + std::to_string(page_index + 1));
    }
}

int PdfAssembler::page_count() const { return FPDF_GetPageCount(doc_); }

Bytes PdfAssembler::save() { return save_document(doc_, FPDF_NO_INCREMENTAL); }

} // namespace pdfmask
