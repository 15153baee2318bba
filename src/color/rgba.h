#ifndef RGBA_H
#define RGBA_H

// Uniform polygon fill. Alpha is a byte, opacity = a / 255.
struct rgba {
	unsigned char r;
	unsigned char g;
	unsigned char b;
	unsigned char a;
	bool operator==(const rgba &ar) const
	{
		return r==ar.r && g==ar.g && b==ar.b && a==ar.a;
	}
	bool operator!=(const rgba &ar) const
	{
		return !(*this == ar);
	}
};

#endif
