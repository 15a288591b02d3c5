#pragma once
#include <optional>
#include <string>
#include <vector>
#include "fields.hpp"


namespace clot::torrent {

    class Layout;

    /**
     * @brief Per-record binding of one field. Registers itself with the
     * record's Layout on construction, in declaration order.
     *
     * The slot is unloaded until the first read, an explicit load or an
     * assignment. Loading pops the key out of the record dictionary, and a
     * missing key empties the slot; saving pushes the value back, or removes
     * the key for an empty slot. A field that was never loaded nor assigned
     * is left alone on save.
     */
    class AttrBase
    {
    public:
        explicit AttrBase(Layout& layout);
        virtual ~AttrBase() = default;

        AttrBase(const AttrBase&) = delete;
        AttrBase& operator=(const AttrBase&) = delete;

        virtual const std::string& key() const = 0;
        virtual const std::string& name() const = 0;
        virtual bool isContext() const = 0;

        // Failure leaves the key in the dictionary and the slot as it was.
        virtual void loadFrom() = 0;
        virtual void saveTo() = 0;

        // Text to show in a dump instead of the stored value.
        virtual std::optional<std::string> displayText() const = 0;

        bool loaded() const noexcept { return loaded_; }
        bool consumed() const noexcept { return consumed_; }

    protected:
        Layout& layout_;
        bool loaded_{false};
        bool consumed_{false};      // loaded during the current bulk pass

    private:
        friend class Layout;
    };


    class Layout
    {
    public:
        Layout(bencode::Dict& data, TextContext& context) : data_(data), context_(context) {}

        Layout(const Layout&) = delete;
        Layout& operator=(const Layout&) = delete;

        void add(AttrBase& attr) { attrs_.push_back(&attr); }

        /**
         * @brief Loads every field once. Context fields go first so that text
         * fields can decode with them; a field already pulled in during the
         * pass, by another field's decoding, is not loaded again.
         */
        void load();

        void save();

        // True while load() runs.
        bool loading() const noexcept { return loading_; }

        bencode::Dict& data() noexcept { return data_; }
        TextContext& context() noexcept { return context_; }
        const std::vector<AttrBase*>& attrs() const noexcept { return attrs_; }

    private:
        bencode::Dict& data_;
        TextContext& context_;
        std::vector<AttrBase*> attrs_;
        bool loading_{false};
    };


    template <typename T>
    class Attr : public AttrBase
    {
    public:
        Attr(Layout& layout, const Field<T>& field) : AttrBase(layout), field_(field) {}

        // Loads on first access, and once more per bulk pass.
        const std::optional<T>& get() {
            if (!loaded_ || (layout_.loading() && !consumed_)) loadFrom();
            return value_;
        }

        // Validates before storing; nullopt clears the field.
        void set(std::optional<T> value) {
            if (value) {
                if (field_.adopt) value = field_.adopt(std::move(*value));
                field_.validate(*value);
            }
            value_ = std::move(value);
            loaded_ = true;
        }

        Attr& operator=(std::optional<T> value) {
            set(std::move(value));
            return *this;
        }

        const Field<T>& field() const noexcept { return field_; }

        const std::string& key() const override { return field_.key; }
        const std::string& name() const override { return field_.name; }
        bool isContext() const override { return field_.context; }

        void loadFrom() override {
            auto& data = layout_.data();
            consumed_ = true;

            const auto* found = data.find(field_.key);
            if (!found) {
                value_.reset();
                loaded_ = true;
                return;
            }

            // The load may consult context fields, which edit the dictionary.
            const bencode::BencodeValue raw = *found;
            T value = field_.load(field_.name, raw, layout_.context());
            field_.validate(value);

            data.erase(field_.key);
            value_ = std::move(value);
            loaded_ = true;
        }

        void saveTo() override {
            if (!loaded_) return;

            std::optional<bencode::BencodeValue> stored;
            if (value_) stored = field_.store(*value_);

            auto& data = layout_.data();
            if (stored) {
                data.set(bencode::DictKey(field_.key), std::move(*stored));
            } else {
                data.erase(field_.key);
            }
        }

        std::optional<std::string> displayText() const override {
            if (!loaded_ || !value_ || !field_.display) return std::nullopt;
            return field_.display(*value_);
        }

    private:
        const Field<T>& field_;
        std::optional<T> value_;
    };

} // namespace clot::torrent
