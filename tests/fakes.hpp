#ifndef PDFMASK_TESTS_FAKES_HPP
#define PDFMASK_TESTS_FAKES_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include "document.hpp"
#include "errors.hpp"
#include "ocr_engine.hpp"
#include "rotation.hpp"
#include "text_util.hpp"

namespace pdfmask {
namespace fakes {

struct FakeLabel {
    Rect box;
    std::string text;
    double font_size = 0;
};

// In-memory page: a list of words laid out on one coordinate system. Page
// text is the words joined by single spaces.
class FakePage : public Page {
public:
    FakePage() = default;
    explicit FakePage(std::vector<PositionedWord> words) : words_(std::move(words)) { renumber(); }

    std::string text() override {
        std::string out;
        for (auto &w : words_) {
            if (!out.empty()) out += ' ';
            out += w.text;
        }
        return out;
    }

    std::vector<PositionedWord> words() override { return words_; }

    std::vector<Rect> search(const std::string &needle) override {
        std::vector<Rect> out;
        if (needle.empty()) return out;
        // offsets of each word inside text()
        std::vector<std::pair<size_t, size_t>> spans;
        size_t pos = 0;
        for (auto &w : words_) {
            spans.emplace_back(pos, pos + w.text.size());
            pos += w.text.size() + 1;
        }
        const std::string hay = to_lower(text());
        const std::string what = to_lower(needle);
        for (size_t at = hay.find(what); at != std::string::npos; at = hay.find(what, at + what.size())) {
            Rect box;
            bool have = false;
            for (size_t i = 0; i < words_.size(); ++i) {
                if (spans[i].second <= at || spans[i].first >= at + what.size()) continue;
                box = have ? box.united(words_[i].box) : words_[i].box;
                have = true;
            }
            if (have) out.push_back(box);
        }
        ++search_calls;
        return out;
    }

    void add_redaction(const Rect &area) override { pending_.push_back(area.normalized()); }

    std::vector<std::size_t> apply_redactions() override {
        auto covered = [&](const Rect &b) {
            for (auto &m : pending_) {
                double ov = span_overlap(b.x0, b.x1, m.x0, m.x1) * span_overlap(b.y0, b.y1, m.y0, m.y1);
                if (ov >= 0.5 * b.width() * b.height()) return true;
            }
            return false;
        };
        std::vector<PositionedWord> kept;
        for (auto &w : words_) {
            if (!covered(w.box)) kept.push_back(w);
        }
        words_ = std::move(kept);
        renumber();
        std::vector<FakeLabel> labels;
        for (auto &l : labels_) {
            if (!covered(l.box)) labels.push_back(l);
        }
        labels_ = std::move(labels);
        // a new fill replaces any earlier fill it covers
        std::vector<Rect> kept_fills;
        for (auto &f : fills) {
            bool hidden = false;
            for (auto &m : pending_) hidden = hidden || m.contains(f);
            if (!hidden) kept_fills.push_back(f);
        }
        fills = std::move(kept_fills);
        for (auto &m : pending_) fills.push_back(m);
        pending_.clear();
        ++apply_calls;
        return residual;
    }

    // A label fits when it is at most half the font size wide per character.
    bool insert_label(const Rect &box, const std::string &label, double font_size) override {
        if (label.size() * font_size * 0.5 > box.width() || font_size > box.height()) return false;
        labels_.push_back({box, label, font_size});
        return true;
    }

    cv::Mat render(int) override { return cv::Mat(20, 10, CV_8UC3, cv::Scalar(255, 255, 255)); }
    int rotation() const override { return rotation_; }
    void rotate(int clockwise_degrees) override { rotation_ = ((rotation_ + clockwise_degrees) % 360 + 360) % 360; }

    const std::vector<FakeLabel> &labels() const { return labels_; }
    void set_rotation(int r) { rotation_ = r; }
    void add_label(FakeLabel l) { labels_.push_back(std::move(l)); }

    std::vector<Rect> fills;
    std::vector<std::size_t> residual; // mark indices reported as still covering text
    int apply_calls = 0;
    int search_calls = 0;

private:
    void renumber() {
        for (size_t i = 0; i < words_.size(); ++i) words_[i].sequence_index = i;
    }

    std::vector<PositionedWord> words_;
    std::vector<Rect> pending_;
    std::vector<FakeLabel> labels_;
    int rotation_ = 0;
};

class FakeDocument : public Document {
public:
    FakeDocument() = default;

    FakePage &add_page(std::vector<PositionedWord> words = {}) {
        pages_.emplace_back(new FakePage(std::move(words)));
        return *pages_.back();
    }

    int page_count() const override { return static_cast<int>(pages_.size()); }
    Page &page(int index) override { return fake_page(index); }
    FakePage &fake_page(int index) { return *pages_.at(static_cast<size_t>(index)); }

    nlohmann::json to_json() {
        nlohmann::json doc = nlohmann::json::array();
        for (auto &p : pages_) {
            nlohmann::json words = nlohmann::json::array();
            for (auto &w : p->words()) words.push_back({{"t", w.text}, {"b", {w.box.x0, w.box.y0, w.box.x1, w.box.y1}}});
            nlohmann::json labels = nlohmann::json::array();
            for (auto &l : p->labels()) {
                labels.push_back({{"t", l.text}, {"fs", l.font_size}, {"b", {l.box.x0, l.box.y0, l.box.x1, l.box.y1}}});
            }
            nlohmann::json fills = nlohmann::json::array();
            for (auto &f : p->fills) fills.push_back({f.x0, f.y0, f.x1, f.y1});
            doc.push_back({{"words", words}, {"labels", labels}, {"fills", fills}, {"rotation", p->rotation()}});
        }
        return doc;
    }

    Bytes save() override {
        const std::string s = to_json().dump();
        return Bytes(s.begin(), s.end());
    }

private:
    std::vector<std::unique_ptr<FakePage>> pages_;
};

inline Rect rect_from(const nlohmann::json &b) {
    return {b.at(0).get<double>(), b.at(1).get<double>(), b.at(2).get<double>(), b.at(3).get<double>()};
}

// Opens what FakeDocument::save() wrote. Anything else is an IoError.
class FakeProvider : public DocumentProvider {
public:
    std::unique_ptr<Document> open(const Bytes &data) const override {
        ++opens;
        nlohmann::json j = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
        if (j.is_discarded() || !j.is_array()) throw IoError("not a fake document");
        std::unique_ptr<FakeDocument> doc(new FakeDocument());
        for (auto &p : j) {
            std::vector<PositionedWord> words;
            for (auto &w : p.at("words")) words.push_back({rect_from(w.at("b")), w.at("t").get<std::string>(), 0});
            FakePage &page = doc->add_page(std::move(words));
            for (auto &l : p.at("labels")) page.add_label({rect_from(l.at("b")), l.at("t").get<std::string>(), l.at("fs").get<double>()});
            if (p.contains("fills")) {
                for (auto &f : p.at("fills")) page.fills.push_back(rect_from(f));
            }
            page.set_rotation(p.at("rotation").get<int>());
        }
        return std::move(doc);
    }

    mutable int opens = 0;
};

// One line of words, each `width` wide with a 5 unit gap, height 10.
inline std::vector<PositionedWord> line_of(const std::vector<std::string> &texts, double y = 100, double x = 10,
                                           double width = 40) {
    std::vector<PositionedWord> out;
    for (auto &t : texts) {
        out.push_back({{x, y, x + width, y + 10}, t, out.size()});
        x += width + 5;
    }
    return out;
}

// Serialised single-page document holding `texts` on one line.
inline Bytes page_bytes(const std::vector<std::string> &texts) {
    FakeDocument doc;
    doc.add_page(line_of(texts));
    return doc.save();
}

class MockOcrEngine : public OcrEngine {
public:
    MOCK_METHOD(OcrOutcome, run, (const Bytes &input, const OcrRequest &request, const OcrProgress &progress),
                (override));
};

class MockRotationDetector : public RotationDetector {
public:
    MOCK_METHOD(int, detect, (const cv::Mat &page_image), (override));
};

inline OcrOutcome ocr_result(Bytes data) {
    OcrOutcome o;
    o.data = std::move(data);
    return o;
}

inline OcrOutcome ocr_cancelled() {
    OcrOutcome o;
    o.cancelled = true;
    return o;
}

} // namespace fakes
} // namespace pdfmask

#endif // PDFMASK_TESTS_FAKES_HPP
