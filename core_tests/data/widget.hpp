#pragma once

#include <string>
#include <utility>

namespace shapes {

// Not mocked: outside of the target class.
virtual void free_standing();

class Canvas;

class Widget : public Drawable
{
public:
    virtual ~Widget() = default;

    virtual int width() const = 0;
    virtual std::pair<int, int> origin() const;
    virtual bool resize(int w,
                        int h = 0) = 0;
    virtual void paint(Canvas &canvas) final;
    void draw(const std::string &label) override;
    int id() const { return id_; }

private:
    int id_ = 0;
};

class Other {
    virtual void other();
};

} // namespace shapes
