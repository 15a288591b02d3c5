#include "../include/layout.hpp"

namespace clot::torrent {

    AttrBase::AttrBase(Layout& layout) : layout_(layout) {
        layout.add(*this);
    }

    void Layout::load() {
        struct PassGuard
        {
            bool& flag;
            explicit PassGuard(bool& f) : flag(f) { flag = true; }
            ~PassGuard() { flag = false; }
        } pass(loading_);

        for (auto* attr : attrs_) attr->consumed_ = false;

        // Phase 1: record-wide context (encoding, codepage).
        for (auto* attr : attrs_) {
            if (attr->isContext() && !attr->consumed_) attr->loadFrom();
        }

        // Phase 2: everything else, skipping fields pulled in by phase 1 or
        // by an earlier field's decoding.
        for (auto* attr : attrs_) {
            if (!attr->consumed_) attr->loadFrom();
        }
    }

    void Layout::save() {
        for (auto* attr : attrs_) attr->saveTo();
    }

} // namespace clot::torrent
